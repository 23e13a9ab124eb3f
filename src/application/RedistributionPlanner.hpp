/**
 * @file RedistributionPlanner.hpp
 * @brief Turns high-risk forecasts into redistribution proposals.
 */

#pragma once

#include <memory>
#include <vector>

#include "application/Redistributor.hpp"
#include "domain/DemandForecast.hpp"
#include "domain/RiskLevel.hpp"

namespace hemoflow::application {

class RedistributionPlanner {
public:
    explicit RedistributionPlanner(std::shared_ptr<Redistributor> redistributor);

    /**
     * @brief Proposes transfers for every blood type with a forecast at or above @p threshold.
     *
     * Each proposal is marked forecast-based and lists the regions whose
     * forecasts triggered it, in the order they first appear in @p forecasts.
     */
    std::vector<domain::RedistributionOpportunity> applyForecastBasedRedistribution(
        const std::vector<domain::DemandForecast>& forecasts,
        domain::RiskLevel threshold = domain::RiskLevel::High);

    /**
     * @brief Copy of @p plan ordered by descending priority.
     *
     * Proposals of equal priority keep their relative order.
     */
    static std::vector<domain::RedistributionOpportunity> byPriority(
        std::vector<domain::RedistributionOpportunity> plan);

private:
    std::shared_ptr<Redistributor> m_redistributor;
};

} // namespace hemoflow::application
