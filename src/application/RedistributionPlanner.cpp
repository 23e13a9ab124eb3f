#include "application/RedistributionPlanner.hpp"
#include "domain/EngineErrors.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <string>

namespace hemoflow::application {

using namespace hemoflow::domain;

RedistributionPlanner::RedistributionPlanner(std::shared_ptr<Redistributor> redistributor)
    : m_redistributor(std::move(redistributor)) {
    if (!m_redistributor) {
        throw InvalidArgument("RedistributionPlanner requires a redistributor");
    }
}

std::vector<RedistributionOpportunity> RedistributionPlanner::applyForecastBasedRedistribution(
    const std::vector<DemandForecast>& forecasts,
    RiskLevel threshold) {

    std::map<std::string, std::vector<std::string>> regionsByBloodType;
    for (const auto& f : forecasts) {
        if (!IsAtLeast(f.shortageRisk, threshold)) continue;
        auto& regions = regionsByBloodType[f.bloodType];
        if (std::find(regions.begin(), regions.end(), f.region) == regions.end()) {
            regions.push_back(f.region);
        }
    }

    std::vector<RedistributionOpportunity> plan;
    for (const auto& [bloodType, regions] : regionsByBloodType) {
        auto opportunities = m_redistributor->identifyOpportunities(bloodType);
        for (auto& op : opportunities) {
            op.forecastBased = true;
            op.predictedShortageRegions = regions;
            plan.push_back(std::move(op));
        }
    }

    std::cout << "[RedistributionPlanner] " << regionsByBloodType.size() << " blood types at or above "
              << RiskToString(threshold) << " risk, " << plan.size() << " proposals" << std::endl;
    return plan;
}

std::vector<RedistributionOpportunity> RedistributionPlanner::byPriority(std::vector<RedistributionOpportunity> plan) {
    std::stable_sort(plan.begin(), plan.end(),
        [](const RedistributionOpportunity& a, const RedistributionOpportunity& b) {
            return a.priority > b.priority;
        });
    return plan;
}

} // namespace hemoflow::application
