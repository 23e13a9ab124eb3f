/**
 * @file InventoryCell.hpp
 * @brief Stock of one blood type at one hospital and its classification.
 */

#pragma once

#include <string>

namespace hemoflow::domain {

/**
 * @struct InventoryCell
 * @brief Current units of one blood type held by one hospital.
 *
 * Invariants: 0 <= currentUnits <= maxCapacity and minRequired <= maxCapacity.
 */
struct InventoryCell {
    int hospitalId = 0;
    std::string hospitalName;
    std::string region;
    std::string bloodType;
    int currentUnits = 0;
    int minRequired = 10;
    int maxCapacity = 100;
};

/**
 * @enum InventoryStatus
 * @brief Status band of a cell relative to its bounds.
 */
enum class InventoryStatus {
    Critical,   ///< Below half the minimum requirement.
    Low,        ///< Below the minimum requirement.
    Adequate,
    Excess      ///< Above 90% of capacity.
};

inline std::string StatusToString(InventoryStatus status) {
    switch (status) {
        case InventoryStatus::Critical: return "Critical";
        case InventoryStatus::Low: return "Low";
        case InventoryStatus::Adequate: return "Adequate";
        case InventoryStatus::Excess: return "Excess";
    }
    return "Adequate";
}

/**
 * @struct CellAssessment
 * @brief A cell together with its status band and shortage/surplus units.
 */
struct CellAssessment {
    InventoryCell cell;
    InventoryStatus status = InventoryStatus::Adequate;
    double shortage = 0.0;   ///< max(0, minRequired - current)
    double surplus = 0.0;    ///< max(0, current - 1.5 * minRequired)
};

/**
 * @struct InventoryFilter
 * @brief Optional selection criteria for inventory reads. Empty fields match everything.
 */
struct InventoryFilter {
    std::string bloodType;
    std::string region;
    int hospitalId = 0;   ///< 0 matches any hospital.

    bool matches(const InventoryCell& cell) const {
        if (!bloodType.empty() && cell.bloodType != bloodType) return false;
        if (hospitalId != 0 && cell.hospitalId != hospitalId) return false;
        if (!region.empty() && cell.region.find(region) == std::string::npos) return false;
        return true;
    }
};

} // namespace hemoflow::domain
