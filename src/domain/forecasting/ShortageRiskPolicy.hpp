/**
 * @file ShortageRiskPolicy.hpp
 * @brief Domain service mapping predicted demand and stock to a shortage risk.
 */

#pragma once

#include "domain/RiskLevel.hpp"

namespace hemoflow::domain::forecasting {

class ShortageRiskPolicy {
public:
    /** @brief Coverage used when no demand is predicted. */
    static constexpr double kNoDemandCoverage = 10.0;

    /** @brief currentInventory / predictedDemand, or kNoDemandCoverage when demand is not positive. */
    static double coverageRatio(double predictedDemand, int currentInventory) {
        if (predictedDemand <= 0.0) {
            return kNoDemandCoverage;
        }
        return static_cast<double>(currentInventory) / predictedDemand;
    }

    /**
     * @brief Coverage >= 3 is Low, >= 2 Medium, >= 1 High, otherwise Critical.
     *
     * Empty or negative stock is Critical whatever the demand.
     */
    static RiskLevel assess(double predictedDemand, int currentInventory) {
        if (currentInventory <= 0) {
            return RiskLevel::Critical;
        }
        const double coverage = coverageRatio(predictedDemand, currentInventory);
        if (coverage >= 3.0) return RiskLevel::Low;
        if (coverage >= 2.0) return RiskLevel::Medium;
        if (coverage >= 1.0) return RiskLevel::High;
        return RiskLevel::Critical;
    }
};

} // namespace hemoflow::domain::forecasting
