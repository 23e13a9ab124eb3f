/**
 * @file ReportExportService.hpp
 * @brief Renders the outcome of a batch run as JSON or plain text.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/DemandForecast.hpp"
#include "domain/inventory/RedistributionOpportunity.hpp"

namespace hemoflow::application {

/**
 * @struct EngineReport
 * @brief Everything one batch run produced.
 */
struct EngineReport {
    domain::TimePoint generatedAt;
    int horizonHours = 0;
    domain::RiskLevel threshold = domain::RiskLevel::High;
    std::vector<domain::DemandForecast> forecasts;
    domain::ForecastSummary forecastSummary;
    std::vector<domain::ShortageAlert> alerts;
    std::vector<domain::RedistributionOpportunity> plan;
    std::vector<domain::TransferResult> transfers;
    domain::RedistributionSummary inventorySummary;
};

class ReportExportService {
public:
    /**
     * @brief Serializes the report as an indented JSON document.
     */
    static std::string ToJson(const EngineReport& report);

    /**
     * @brief Short human-readable overview for the console.
     * @param maxProposals Number of plan entries listed before eliding the rest.
     */
    static std::string ToText(const EngineReport& report, size_t maxProposals = 10);
};

} // namespace hemoflow::application
