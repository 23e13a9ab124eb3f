/**
 * @file RedistributionOpportunity.hpp
 * @brief Proposed transfers and the results of executed ones.
 */

#pragma once

#include <string>
#include <vector>

namespace hemoflow::domain {

/**
 * @struct RedistributionOpportunity
 * @brief Advisory, non-exclusive proposal to move units between two cells of one blood type.
 */
struct RedistributionOpportunity {
    int fromHospitalId = 0;
    std::string fromHospitalName;
    int toHospitalId = 0;
    std::string toHospitalName;
    std::string bloodType;
    int transferUnits = 0;       ///< <= min(source surplus, destination shortage)
    double priority = 0.0;
    std::string reason;

    bool forecastBased = false;
    std::vector<std::string> predictedShortageRegions;
};

/**
 * @struct TransferResult
 * @brief Post-transfer levels of both cells after a successful execution.
 */
struct TransferResult {
    int fromHospitalId = 0;
    int toHospitalId = 0;
    std::string bloodType;
    int unitsTransferred = 0;
    int sourceRemaining = 0;
    int destinationLevel = 0;
};

/**
 * @struct RedistributionSummary
 * @brief Network-wide counts by status band and the rebalancing ceiling.
 */
struct RedistributionSummary {
    size_t totalHospitals = 0;
    size_t totalInventoryRecords = 0;
    size_t criticalCount = 0;
    size_t lowCount = 0;
    size_t adequateCount = 0;
    size_t excessCount = 0;
    double totalShortageUnits = 0.0;
    double totalSurplusUnits = 0.0;
    double redistributionPotential = 0.0;   ///< min(totalShortageUnits, totalSurplusUnits)
    size_t bloodTypesTracked = 0;
};

} // namespace hemoflow::domain
