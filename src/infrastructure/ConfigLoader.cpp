/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/BloodTypes.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace hemoflow::infrastructure {

using json = nlohmann::json;

namespace {

int ClampInt(const char* key, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        int clamped = std::clamp(value, lo, hi);
        std::cerr << "[ConfigLoader] '" << key << "' = " << value
                  << " out of range, using " << clamped << std::endl;
        return clamped;
    }
    return value;
}

void ApplyJson(const json& j, EngineConfig& config) {
    config.modelPath = j.value("model_path", config.modelPath);
    config.inventoryPath = j.value("inventory_path", config.inventoryPath);
    config.historyPath = j.value("history_path", config.historyPath);

    config.trainingDaysBack = ClampInt("training_days_back", j.value("training_days_back", config.trainingDaysBack), 1, 3650);
    config.syntheticSeed = j.value("synthetic_seed", config.syntheticSeed);

    if (j.contains("forest") && j["forest"].is_object()) {
        const auto& f = j["forest"];
        config.forest.numTrees = ClampInt("forest.num_trees", f.value("num_trees", config.forest.numTrees), 1, 1000);
        config.forest.maxDepth = ClampInt("forest.max_depth", f.value("max_depth", config.forest.maxDepth), 1, 64);
        config.forest.minSamplesSplit = ClampInt("forest.min_samples_split", f.value("min_samples_split", config.forest.minSamplesSplit), 2, 100000);
        config.forest.minSamplesLeaf = ClampInt("forest.min_samples_leaf", f.value("min_samples_leaf", config.forest.minSamplesLeaf), 1, 100000);
        config.forest.seed = f.value("seed", config.forest.seed);
    }

    config.horizonHours = ClampInt("horizon_hours", j.value("horizon_hours", config.horizonHours), 1, 168);
    config.defaultInventoryUnits = ClampInt("default_inventory_units", j.value("default_inventory_units", config.defaultInventoryUnits), 0, 1000000);

    if (j.contains("regions") && j["regions"].is_array()) {
        config.regions = j["regions"].get<std::vector<std::string>>();
    }

    config.newCellMinRequired = ClampInt("new_cell_min_required", j.value("new_cell_min_required", config.newCellMinRequired), 0, 1000000);
    config.newCellMaxCapacity = ClampInt("new_cell_max_capacity", j.value("new_cell_max_capacity", config.newCellMaxCapacity), 1, 1000000);
    if (config.newCellMinRequired > config.newCellMaxCapacity) {
        std::cerr << "[ConfigLoader] new_cell_min_required exceeds new_cell_max_capacity, lowering it" << std::endl;
        config.newCellMinRequired = config.newCellMaxCapacity;
    }

    if (j.contains("risk_threshold")) {
        auto level = domain::RiskFromString(j["risk_threshold"].get<std::string>());
        if (level) {
            config.riskThreshold = *level;
        } else {
            std::cerr << "[ConfigLoader] Unknown risk_threshold, keeping "
                      << domain::RiskToString(config.riskThreshold) << std::endl;
        }
    }
}

void ResolveDefaults(EngineConfig& config) {
    if (config.modelPath.empty()) {
        config.modelPath = PathUtils::GetDefaultModelPath().string();
    }
    if (config.inventoryPath.empty()) {
        config.inventoryPath = PathUtils::GetDefaultInventoryPath().string();
    }
    if (config.regions.empty()) {
        config.regions = domain::DefaultRegions();
    }
}

} // namespace

EngineConfig ConfigLoader::Load(const std::string& configPath) {
    EngineConfig config;

    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            json j = json::parse(f);
            ApplyJson(j, config);
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                      << ". Using defaults." << std::endl;
            config = EngineConfig{};
        }
    }

    ResolveDefaults(config);
    return config;
}

bool ConfigLoader::Save(const std::string& configPath, const EngineConfig& config) {
    json j;
    j["model_path"] = config.modelPath;
    j["inventory_path"] = config.inventoryPath;
    j["history_path"] = config.historyPath;
    j["training_days_back"] = config.trainingDaysBack;
    j["synthetic_seed"] = config.syntheticSeed;
    j["forest"] = {
        {"num_trees", config.forest.numTrees},
        {"max_depth", config.forest.maxDepth},
        {"min_samples_split", config.forest.minSamplesSplit},
        {"min_samples_leaf", config.forest.minSamplesLeaf},
        {"seed", config.forest.seed}
    };
    j["horizon_hours"] = config.horizonHours;
    j["default_inventory_units"] = config.defaultInventoryUnits;
    j["regions"] = config.regions;
    j["new_cell_min_required"] = config.newCellMinRequired;
    j["new_cell_max_capacity"] = config.newCellMaxCapacity;
    j["risk_threshold"] = domain::RiskToString(config.riskThreshold);

    std::filesystem::path p(configPath);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::ofstream f(p);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace hemoflow::infrastructure
