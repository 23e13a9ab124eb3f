#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "application/Redistributor.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DemandHistoryFs.hpp"
#include "infrastructure/JsonInventoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace hemoflow::domain;
using namespace hemoflow::application;
using namespace hemoflow::infrastructure;

int main() {
    std::cout << "[Test] Starting Inventory Round-Trip Test..." << std::endl;

    std::string testRoot = "test_hemoflow_store";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    const std::string inventoryPath = testRoot + "/inventory.json";

    auto persistence = std::make_shared<PersistenceService>();

    {
        auto repo = std::make_shared<JsonInventoryRepository>(inventoryPath, persistence);
        Redistributor redistributor(repo);
        redistributor.setCurrentUnits(1, "O+", 3, "Apollo Hospital", "South Delhi");
        redistributor.setCurrentUnits(2, "O+", 64, "Max Hospital", "North Delhi");
        redistributor.executeRedistribution(2, 1, "O+", 7);
        redistributor.executeRedistribution(2, 5, "O+", 4);
        repo->flush();
    }
    assert(std::filesystem::exists(inventoryPath));

    // Rehydrate
    auto reopened = std::make_shared<JsonInventoryRepository>(inventoryPath, persistence);
    assert(reopened->size() == 3);
    auto apollo = reopened->find(1, "O+");
    assert(apollo && apollo->currentUnits == 10);
    assert(apollo->hospitalName == "Apollo Hospital");
    assert(apollo->region == "South Delhi");
    auto max = reopened->find(2, "O+");
    assert(max && max->currentUnits == 53);
    auto created = reopened->find(5, "O+");
    assert(created && created->currentUnits == 4 && created->maxCapacity == 100);
    std::cout << "[PASS] Inventory survives a reload." << std::endl;

    // A corrupt snapshot is reported and leaves the store as it was.
    std::ofstream(inventoryPath) << "{ not json";
    assert(!reopened->reload());
    assert(reopened->size() == 3);

    // Demand history: one record per line, malformed lines skipped.
    const std::string historyPath = testRoot + "/history.ndjson";
    {
        DemandRecord record;
        record.bloodType = "A+";
        record.region = "Noida";
        record.date = FromCalendarDate(2026, 8, 10);
        record.unitsConsumed = 31;
        record.season = "Monsoon";
        record.outbreak = true;

        std::ofstream out(historyPath);
        out << DemandHistoryFs::toLine(record) << "\n";
        out << "this is not a record\n";
        record.date = FromCalendarDate(2025, 1, 10);   // outside the window
        out << DemandHistoryFs::toLine(record) << "\n";
    }
    DemandHistoryFs history(historyPath);
    auto rows = history.fetchHistory(30, FromCalendarDate(2026, 8, 20));
    assert(rows.size() == 1);
    assert(rows[0].bloodType == "A+");
    assert(rows[0].unitsConsumed == 31);
    assert(rows[0].season == "Monsoon");
    assert(rows[0].outbreak);
    assert(DemandHistoryFs(testRoot + "/missing.ndjson").fetchHistory(30, FromCalendarDate(2026, 8, 20)).empty());
    std::cout << "[PASS] Demand history ingestion." << std::endl;

    // Settings: defaults, overrides, clamping.
    const std::string configPath = testRoot + "/settings.json";
    auto defaults = ConfigLoader::Load(configPath);
    assert(defaults.horizonHours == 48);
    assert(defaults.forest.numTrees == 100);
    assert(defaults.regions.size() == 8);
    assert(!defaults.modelPath.empty());
    assert(defaults.riskThreshold == RiskLevel::High);

    std::ofstream(configPath) << R"({"horizon_hours": 500, "forest": {"num_trees": 25},
                                     "regions": ["Noida"], "risk_threshold": "Critical"})";
    auto loaded = ConfigLoader::Load(configPath);
    assert(loaded.horizonHours == 168);
    assert(loaded.forest.numTrees == 25);
    assert(loaded.forest.maxDepth == 10);
    assert(loaded.regions.size() == 1);
    assert(loaded.riskThreshold == RiskLevel::Critical);

    assert(ConfigLoader::Save(configPath, loaded));
    auto saved = ConfigLoader::Load(configPath);
    assert(saved.forest.numTrees == 25);
    assert(saved.modelPath == loaded.modelPath);

    std::ofstream(configPath) << "{ broken";
    auto fallback = ConfigLoader::Load(configPath);
    assert(fallback.horizonHours == 48);
    std::cout << "[PASS] Settings load, clamp and save." << std::endl;

    persistence->flush();
    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Inventory Round-Trip Test." << std::endl;
    return 0;
}
