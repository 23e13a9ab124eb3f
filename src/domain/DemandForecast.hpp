/**
 * @file DemandForecast.hpp
 * @brief Forecast records and the derived alert/summary views.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include "domain/Calendar.hpp"
#include "domain/RiskLevel.hpp"

namespace hemoflow::domain {

/**
 * @struct DemandForecast
 * @brief Predicted demand for one (blood type, region) at a future instant.
 */
struct DemandForecast {
    std::string bloodType;
    std::string region;
    TimePoint forecastDate;
    double predictedDemand = 0.0;   ///< Units, never negative.
    double confidence = 0.5;        ///< Within [0.5, 0.95].
    int currentInventory = 0;       ///< Stock the risk was assessed against.
    RiskLevel shortageRisk = RiskLevel::Low;
    bool alertSent = false;
};

/**
 * @struct ForecastSummary
 * @brief Aggregate view of a batch of forecasts.
 */
struct ForecastSummary {
    size_t totalForecasts = 0;
    std::map<RiskLevel, size_t> riskCounts;
    std::set<std::string> regionsCovered;
    std::set<std::string> bloodTypesCovered;

    size_t countFor(RiskLevel level) const {
        auto it = riskCounts.find(level);
        return it == riskCounts.end() ? 0 : it->second;
    }
};

/**
 * @struct ShortageAlert
 * @brief Alert content for a predicted shortage. Delivery is the caller's concern.
 */
struct ShortageAlert {
    std::string alertType = "blood_shortage_prediction";
    std::string bloodType;
    std::string region;
    double predictedDemand = 0.0;
    RiskLevel shortageRisk = RiskLevel::Low;
    TimePoint forecastDate;
    std::string message;
    std::string callToAction;
};

} // namespace hemoflow::domain
