/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; services receive plain option structs.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/RiskLevel.hpp"
#include "domain/forecasting/RegressionForest.hpp"

namespace hemoflow::infrastructure {

/**
 * @struct EngineConfig
 * @brief All tunables of a batch run. Defaults apply to anything the file omits.
 */
struct EngineConfig {
    std::string modelPath;        ///< Empty resolves to PathUtils::GetDefaultModelPath().
    std::string inventoryPath;    ///< Empty resolves to PathUtils::GetDefaultInventoryPath().
    std::string historyPath;      ///< Empty means synthesized training data.

    int trainingDaysBack = 365;
    domain::forecasting::ForestParams forest;
    unsigned syntheticSeed = 7;

    int horizonHours = 48;
    int defaultInventoryUnits = 50;
    std::vector<std::string> regions;   ///< Empty resolves to domain::DefaultRegions().

    int newCellMinRequired = 10;
    int newCellMaxCapacity = 100;
    domain::RiskLevel riskThreshold = domain::RiskLevel::High;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p configPath.
     *
     * A missing file yields defaults. A malformed file is reported on stderr
     * and also yields defaults. Out-of-range values are clamped with a warning.
     */
    static EngineConfig Load(const std::string& configPath);

    /** @brief Writes @p config to @p configPath as indented JSON. Returns false on I/O failure. */
    static bool Save(const std::string& configPath, const EngineConfig& config);
};

} // namespace hemoflow::infrastructure
