/**
 * @file HemoFlowApp.cpp
 * @brief Implementation of HemoFlowApp.
 */

#include "app/HemoFlowApp.hpp"

#include <chrono>
#include <iostream>
#include <random>

#include "application/ReportExportService.hpp"
#include "domain/BloodTypes.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/DemandHistoryFs.hpp"
#include "infrastructure/JsonInventoryRepository.hpp"
#include "infrastructure/ModelArtifactStore.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SyntheticDemandSource.hpp"

namespace hemoflow::app {

using namespace hemoflow::domain;

namespace {

struct DemoHospital {
    int id;
    const char* name;
    const char* region;
};

const DemoHospital kDemoHospitals[] = {
    {1, "Apollo Hospital", "South Delhi"},
    {2, "AIIMS", "South Delhi"},
    {3, "Max Hospital", "North Delhi"},
    {4, "Fortis Hospital", "Noida"},
    {5, "Safdarjung Hospital", "Central Delhi"},
    {6, "BLK Hospital", "West Delhi"}
};

int ParseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw InvalidArgument(flag + " expects an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw InvalidArgument(flag + " expects an integer, got '" + value + "'");
    }
}

} // namespace

std::string HemoFlowApp::Usage() {
    return "Usage: hemoflow [options]\n"
           "  --config <file>      settings.json to load (default: XDG config location)\n"
           "  --retrain            ignore the saved model and train a new one\n"
           "  --hours <N>          forecast horizon in hours, 1..168\n"
           "  --region <name>      region to forecast; repeatable\n"
           "  --threshold <level>  minimum risk for the plan: Low, Medium, High, Critical\n"
           "  --execute <N>        execute the N highest-priority proposals\n"
           "  --report <file>      write the full report as JSON\n"
           "  --help               show this text\n";
}

RunOptions HemoFlowApp::ParseArguments(const std::vector<std::string>& args) {
    RunOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw InvalidArgument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--config") {
            options.configPath = next();
        } else if (arg == "--retrain") {
            options.retrain = true;
        } else if (arg == "--hours") {
            options.horizonHours = ParseInt(arg, next());
        } else if (arg == "--region") {
            options.regions.push_back(next());
        } else if (arg == "--threshold") {
            const std::string& name = next();
            options.threshold = RiskFromString(name);
            if (!options.threshold) {
                throw InvalidArgument("Unknown risk level '" + name + "'");
            }
        } else if (arg == "--execute") {
            options.executeCount = ParseInt(arg, next());
            if (options.executeCount < 0) {
                throw InvalidArgument("--execute must not be negative");
            }
        } else if (arg == "--report") {
            options.reportPath = next();
        } else {
            throw InvalidArgument("Unknown option '" + arg + "'");
        }
    }
    return options;
}

int HemoFlowApp::Run(int argc, char** argv) {
    try {
        m_options = ParseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const InvalidArgument& e) {
        std::cerr << "[HemoFlowApp] " << e.what() << "\n\n" << Usage();
        return 2;
    }
    if (m_options.showHelp) {
        std::cout << Usage();
        return 0;
    }

    int code = 1;
    try {
        Init();
        code = Execute();
    } catch (const std::exception& e) {
        std::cerr << "[HemoFlowApp] Fatal: " << e.what() << std::endl;
        code = 1;
    }
    Shutdown();
    return code;
}

void HemoFlowApp::Init() {
    const std::string configPath = m_options.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultConfigPath().string()
        : m_options.configPath;
    m_config = infrastructure::ConfigLoader::Load(configPath);

    if (m_options.horizonHours) m_config.horizonHours = *m_options.horizonHours;
    if (!m_options.regions.empty()) m_config.regions = m_options.regions;
    if (m_options.threshold) m_config.riskThreshold = *m_options.threshold;

    // Composition root
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();

    m_services.inventory = std::make_shared<infrastructure::JsonInventoryRepository>(
        m_config.inventoryPath, m_services.persistenceService);

    std::shared_ptr<DemandDataSource> history;
    if (!m_config.historyPath.empty()) {
        history = std::make_shared<infrastructure::DemandHistoryFs>(m_config.historyPath);
    }
    auto synthetic = std::make_shared<infrastructure::SyntheticDemandSource>(m_config.syntheticSeed, m_config.regions);
    auto artifacts = std::make_shared<infrastructure::ModelArtifactStore>(m_config.modelPath, m_services.persistenceService);

    application::ForecasterOptions forecasterOptions;
    forecasterOptions.trainingDaysBack = m_config.trainingDaysBack;
    forecasterOptions.forest = m_config.forest;
    forecasterOptions.defaultInventoryUnits = m_config.defaultInventoryUnits;
    forecasterOptions.regions = m_config.regions;

    m_services.forecaster = std::make_unique<application::DemandForecaster>(
        history, synthetic, artifacts, m_services.inventory, m_services.taskManager, forecasterOptions);

    application::RedistributorOptions redistributorOptions;
    redistributorOptions.newCellMinRequired = m_config.newCellMinRequired;
    redistributorOptions.newCellMaxCapacity = m_config.newCellMaxCapacity;
    m_services.redistributor = std::make_shared<application::Redistributor>(m_services.inventory, redistributorOptions);
    m_services.planner = std::make_unique<application::RedistributionPlanner>(m_services.redistributor);

    std::cout << "[HemoFlowApp] Model: " << m_config.modelPath << std::endl;
    std::cout << "[HemoFlowApp] Inventory: " << m_config.inventoryPath << std::endl;
}

void HemoFlowApp::SeedDemoInventory() {
    if (!m_services.inventory->findAll({}).empty()) {
        return;
    }
    std::cout << "[HemoFlowApp] Inventory is empty, seeding demo stock" << std::endl;

    std::mt19937 rng(m_config.syntheticSeed);
    std::uniform_int_distribution<int> level(0, 95);
    for (const auto& hospital : kDemoHospitals) {
        for (const auto& bloodType : AllBloodTypes()) {
            m_services.redistributor->setCurrentUnits(hospital.id, bloodType, level(rng),
                                                      hospital.name, hospital.region);
        }
    }
}

int HemoFlowApp::Execute() {
    SeedDemoInventory();

    auto& forecaster = *m_services.forecaster;
    auto training = forecaster.trainAsync(m_options.retrain);
    std::cout << "[HemoFlowApp] Waiting for demand model..." << std::endl;
    training->waitFor(std::chrono::hours(1));
    if (training->failed) {
        std::cerr << "[HemoFlowApp] Training failed: " << training->errorMessage << std::endl;
    }
    if (!forecaster.waitUntilReady(std::chrono::seconds(0))) {
        std::cerr << "[HemoFlowApp] " << ModelNotReady().what() << std::endl;
        return 1;
    }

    application::EngineReport report;
    report.generatedAt = std::chrono::system_clock::now();
    report.horizonHours = m_config.horizonHours;
    report.threshold = m_config.riskThreshold;

    report.forecasts = forecaster.generateForecasts(m_config.horizonHours, m_config.regions, report.generatedAt);
    report.forecastSummary = application::DemandForecaster::summarizeForecasts(report.forecasts);
    report.alerts = application::DemandForecaster::composeShortageAlerts(
        report.forecasts, m_config.riskThreshold, report.generatedAt);

    // Planner output is grouped by blood type; execution and the listing go highest priority first.
    report.plan = application::RedistributionPlanner::byPriority(
        m_services.planner->applyForecastBasedRedistribution(report.forecasts, m_config.riskThreshold));

    int executed = 0;
    for (const auto& op : report.plan) {
        if (executed >= m_options.executeCount) break;
        try {
            report.transfers.push_back(m_services.redistributor->executeRedistribution(
                op.fromHospitalId, op.toHospitalId, op.bloodType, op.transferUnits));
            ++executed;
        } catch (const EngineError& e) {
            // Proposals do not reserve stock; an earlier transfer may have drained this source.
            std::cerr << "[HemoFlowApp] Skipping proposal " << op.fromHospitalName << " -> "
                      << op.toHospitalName << ": " << e.what() << std::endl;
        }
    }

    report.inventorySummary = m_services.redistributor->summary();

    std::cout << application::ReportExportService::ToText(report);

    if (!m_options.reportPath.empty()) {
        if (!m_services.persistenceService->writeAtomically(m_options.reportPath,
                                                            application::ReportExportService::ToJson(report))) {
            std::cerr << "[HemoFlowApp] Could not write report to " << m_options.reportPath << std::endl;
            return 1;
        }
        std::cout << "[HemoFlowApp] Report written to " << m_options.reportPath << std::endl;
    }
    return 0;
}

void HemoFlowApp::Shutdown() {
    if (m_services.taskManager) {
        for (const auto& task : m_services.taskManager->GetActiveTasks()) {
            std::cout << "[HemoFlowApp] Waiting for '" << task->description << "'..." << std::endl;
        }
        m_services.taskManager->waitAll();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
        if (m_services.persistenceService->failedWrites() > 0) {
            std::cerr << "[HemoFlowApp] " << m_services.persistenceService->failedWrites()
                      << " inventory snapshot(s) could not be written" << std::endl;
        }
    }
}

} // namespace hemoflow::app
