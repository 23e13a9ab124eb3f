/**
 * @file HemoFlowApp.hpp
 * @brief Batch driver: loads configuration, wires the engine services and runs one forecast/plan cycle.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "application/EngineServices.hpp"
#include "domain/RiskLevel.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace hemoflow::app {

/**
 * @struct RunOptions
 * @brief Command-line overrides applied on top of the loaded configuration.
 */
struct RunOptions {
    std::string configPath;
    bool retrain = false;
    std::optional<int> horizonHours;
    std::vector<std::string> regions;
    std::optional<domain::RiskLevel> threshold;
    int executeCount = 0;       ///< Number of top proposals to execute.
    std::string reportPath;
    bool showHelp = false;
};

/**
 * @class HemoFlowApp
 * @brief Orchestrates the batch lifecycle: parse, initialize, run, shut down.
 */
class HemoFlowApp {
public:
    /**
     * @brief Runs one full cycle.
     * @return Exit code (0 for success, 1 for a runtime failure, 2 for bad arguments).
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses command-line arguments.
     * @throws domain::InvalidArgument on an unknown flag or a malformed value.
     */
    static RunOptions ParseArguments(const std::vector<std::string>& args);

    static std::string Usage();

private:
    /**
     * @brief Loads configuration and builds every service (composition root).
     */
    void Init();

    /**
     * @brief Gives an empty inventory store a reproducible demo stock so the plan has something to match.
     */
    void SeedDemoInventory();

    int Execute();

    void Shutdown();

    RunOptions m_options;
    infrastructure::EngineConfig m_config;
    application::EngineServices m_services;
};

} // namespace hemoflow::app
