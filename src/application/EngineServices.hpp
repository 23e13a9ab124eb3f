/**
 * @file EngineServices.hpp
 * @brief Container for engine services, built once by the composition root and passed to callers.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/DemandForecaster.hpp"
#include "application/RedistributionPlanner.hpp"
#include "application/Redistributor.hpp"
#include "domain/inventory/InventoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace hemoflow::application {

struct EngineServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::shared_ptr<domain::InventoryRepository> inventory;
    std::unique_ptr<DemandForecaster> forecaster;
    std::shared_ptr<Redistributor> redistributor;
    std::unique_ptr<RedistributionPlanner> planner;
};

} // namespace hemoflow::application
