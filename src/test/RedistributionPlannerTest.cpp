#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/RedistributionPlanner.hpp"
#include "application/Redistributor.hpp"
#include "infrastructure/JsonInventoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace hemoflow::domain;
using namespace hemoflow::application;
using namespace hemoflow::infrastructure;

namespace {

void Stock(InventoryRepository& repo, int hospitalId, const std::string& bloodType, int units) {
    InventoryCell cell;
    cell.hospitalId = hospitalId;
    cell.hospitalName = "Hospital " + std::to_string(hospitalId);
    cell.bloodType = bloodType;
    cell.currentUnits = units;
    repo.save(cell);
}

DemandForecast Forecast(const std::string& bloodType, const std::string& region, RiskLevel risk) {
    DemandForecast f;
    f.bloodType = bloodType;
    f.region = region;
    f.forecastDate = FromCalendarDate(2026, 10, 20);
    f.predictedDemand = 20.0;
    f.shortageRisk = risk;
    return f;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RedistributionPlanner Test..." << std::endl;

    auto persistence = std::make_shared<PersistenceService>();
    auto repo = std::make_shared<JsonInventoryRepository>("", persistence);

    // Every blood type below has a shortage and a surplus to match.
    Stock(*repo, 1, "O+", 3);
    Stock(*repo, 2, "O+", 70);
    Stock(*repo, 1, "A+", 6);
    Stock(*repo, 2, "A+", 50);
    Stock(*repo, 1, "B+", 0);
    Stock(*repo, 3, "B+", 90);

    auto redistributor = std::make_shared<Redistributor>(repo);
    RedistributionPlanner planner(redistributor);

    std::vector<DemandForecast> forecasts = {
        Forecast("O+", "Noida", RiskLevel::Low),
        Forecast("A+", "Dwarka", RiskLevel::Medium),
        Forecast("B+", "Noida", RiskLevel::High),
        Forecast("B+", "Gurgaon", RiskLevel::Critical),
        Forecast("B+", "Noida", RiskLevel::Critical),
    };

    auto plan = planner.applyForecastBasedRedistribution(forecasts, RiskLevel::High);
    assert(plan.size() == 1);
    assert(plan[0].bloodType == "B+");
    assert(plan[0].fromHospitalId == 3);
    assert(plan[0].toHospitalId == 1);
    assert(plan[0].forecastBased);
    assert((plan[0].predictedShortageRegions == std::vector<std::string>{"Noida", "Gurgaon"}));
    std::cout << "[PASS] Low and Medium forecasts do not trigger proposals at High." << std::endl;

    auto medium = planner.applyForecastBasedRedistribution(forecasts, RiskLevel::Medium);
    assert(medium.size() == 2);
    for (const auto& op : medium) {
        assert(op.bloodType != "O+");
        assert(op.forecastBased);
        if (op.bloodType == "A+") {
            assert((op.predictedShortageRegions == std::vector<std::string>{"Dwarka"}));
        }
    }

    auto everything = planner.applyForecastBasedRedistribution(forecasts, RiskLevel::Low);
    assert(everything.size() == 3);

    auto onlyCritical = planner.applyForecastBasedRedistribution(forecasts, RiskLevel::Critical);
    assert(onlyCritical.size() == 1);
    assert((onlyCritical[0].predictedShortageRegions == std::vector<std::string>{"Gurgaon", "Noida"}));
    std::cout << "[PASS] Threshold is applied on the ordinal scale." << std::endl;

    assert(planner.applyForecastBasedRedistribution({}, RiskLevel::Low).empty());

    // Proposals are advisory: nothing moved.
    assert(repo->find(1, "B+")->currentUnits == 0);
    assert(repo->find(3, "B+")->currentUnits == 90);

    // Planner output is grouped by blood type; byPriority puts the most urgent transfer first.
    auto ordered = std::make_shared<JsonInventoryRepository>("", persistence);
    Stock(*ordered, 1, "A+", 9);
    Stock(*ordered, 2, "A+", 16);
    Stock(*ordered, 1, "O+", 0);
    Stock(*ordered, 2, "O+", 90);
    RedistributionPlanner orderedPlanner(std::make_shared<Redistributor>(ordered));
    auto grouped = orderedPlanner.applyForecastBasedRedistribution(
        {Forecast("O+", "Noida", RiskLevel::Critical), Forecast("A+", "Noida", RiskLevel::Critical)},
        RiskLevel::Critical);
    assert(grouped.size() == 2);
    assert(grouped[0].bloodType == "A+");

    auto prioritized = RedistributionPlanner::byPriority(grouped);
    assert(prioritized.size() == 2);
    assert(prioritized[0].bloodType == "O+");
    assert(prioritized[0].priority == 157.5);
    assert(prioritized[1].bloodType == "A+");
    assert(prioritized[1].priority == 52.5);
    assert(prioritized[0].priority >= prioritized[1].priority);

    RedistributionOpportunity first, second;
    first.fromHospitalId = 10;
    first.priority = 60.0;
    second.fromHospitalId = 20;
    second.priority = 60.0;
    auto ties = RedistributionPlanner::byPriority({first, second});
    assert(ties[0].fromHospitalId == 10 && ties[1].fromHospitalId == 20);
    std::cout << "[PASS] Plan is ordered highest priority first." << std::endl;

    std::cout << "[PASS] RedistributionPlanner Test." << std::endl;
    return 0;
}
