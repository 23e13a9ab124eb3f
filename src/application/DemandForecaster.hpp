/**
 * @file DemandForecaster.hpp
 * @brief Application service that trains the demand model and produces forecasts.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "domain/DemandDataSource.hpp"
#include "domain/DemandForecast.hpp"
#include "domain/forecasting/TrainedModel.hpp"
#include "domain/inventory/InventoryRepository.hpp"
#include "infrastructure/ModelArtifactStore.hpp"

namespace hemoflow::application {

/**
 * @enum ModelState
 * @brief Lifecycle of the forecaster's model.
 */
enum class ModelState {
    Untrained,
    Training,   ///< First training in progress; no model to serve yet.
    Trained
};

std::string ModelStateToString(ModelState state);

struct ForecasterOptions {
    int trainingDaysBack = 365;
    domain::forecasting::ForestParams forest;
    int defaultInventoryUnits = 50;      ///< Stock assumed for cells with no inventory records.
    std::vector<std::string> regions;    ///< Empty means domain::DefaultRegions().
};

/**
 * @struct TrainingStatus
 * @brief Snapshot of the model lifecycle for status queries.
 */
struct TrainingStatus {
    ModelState state = ModelState::Untrained;
    bool isTrained = false;
    bool isTraining = false;
    bool modelExists = false;
    std::optional<domain::TimePoint> lastTrained;
    size_t trainingRecords = 0;
    double trainingScore = 0.0;
    std::string dataSource;
    long long unknownCategoryCount = 0;
    std::string lastError;
};

struct DemandPrediction {
    double predictedUnits = 0.0;
    double confidence = 0.5;
};

/**
 * @class DemandForecaster
 * @brief Owns the current trained model and serves predictions from it.
 *
 * The model is published as an immutable snapshot. Readers copy the pointer
 * under a short lock and predict without holding it, so a retrain swaps the
 * encoder/forest pair as a whole and in-flight predictions finish on the old one.
 */
class DemandForecaster {
public:
    static constexpr double kMinConfidence = 0.5;
    static constexpr double kMaxConfidence = 0.95;
    static constexpr double kZeroDemandConfidence = 0.7;
    static constexpr int kMaxHorizonHours = 168;

    /**
     * @param history Primary training data.
     * @param fallback Used when @p history returns no rows (typically synthesized data).
     * @param artifacts Model persistence; may be null to keep the model in memory only.
     * @param inventory Current stock lookup for risk assessment; may be null.
     * @param tasks Runs trainAsync(); may be null if only train() is used.
     */
    DemandForecaster(std::shared_ptr<domain::DemandDataSource> history,
                     std::shared_ptr<domain::DemandDataSource> fallback,
                     std::shared_ptr<infrastructure::ModelArtifactStore> artifacts,
                     std::shared_ptr<domain::InventoryRepository> inventory,
                     std::shared_ptr<AsyncTaskManager> tasks,
                     ForecasterOptions options = {});

    /** @brief Waits for any trainAsync() run still using this forecaster. */
    ~DemandForecaster();

    DemandForecaster(const DemandForecaster&) = delete;
    DemandForecaster& operator=(const DemandForecaster&) = delete;

    /**
     * @brief Loads the persisted artifact if one exists.
     * @return True when a model was loaded and published.
     */
    bool loadPersistedModel();

    /**
     * @brief Reloads the artifact (unless @p forceRetrain) or fits a new model and persists it.
     *
     * On failure the previously published model stays in place.
     * @throws domain::EngineError when no training data is available or the artifact cannot be written.
     */
    void train(bool forceRetrain = false);

    /** @brief Runs train() on the task manager. Use waitUntilReady() or the status to await it. */
    std::shared_ptr<TaskStatus> trainAsync(bool forceRetrain = false);

    /** @brief Blocks until a model is published or @p timeout elapses. */
    bool waitUntilReady(std::chrono::milliseconds timeout) const;

    bool isReady() const;
    ModelState state() const;
    TrainingStatus status() const;

    /**
     * @brief Predicts demand for one cell at @p forecastInstant.
     *
     * Unseen categories fall back to code 0 and are counted.
     * @throws domain::ModelNotReady if no model is published.
     */
    DemandPrediction predictDemand(const std::string& bloodType,
                                   const std::string& region,
                                   domain::TimePoint forecastInstant) const;

    static domain::RiskLevel assessShortageRisk(double predictedDemand, int currentInventory);

    /**
     * @brief Forecasts every (region, blood type) cell @p horizonHours ahead of @p now.
     *
     * Cells that fail are logged and skipped.
     * @throws domain::ModelNotReady before any model is published.
     * @throws domain::InvalidArgument if the horizon is outside 1..168 hours.
     */
    std::vector<domain::DemandForecast> generateForecasts(int horizonHours,
                                                          const std::vector<std::string>& regions = {},
                                                          std::optional<domain::TimePoint> now = std::nullopt) const;

    static domain::ForecastSummary summarizeForecasts(const std::vector<domain::DemandForecast>& forecasts);

    /**
     * @brief Builds alerts for future forecasts at or above @p minRisk not yet alerted, marking them sent.
     */
    static std::vector<domain::ShortageAlert> composeShortageAlerts(std::vector<domain::DemandForecast>& forecasts,
                                                                     domain::RiskLevel minRisk,
                                                                     domain::TimePoint now);

    std::shared_ptr<const domain::forecasting::TrainedModel> currentModel() const;

private:
    std::shared_ptr<const domain::forecasting::TrainedModel> fitModel(const std::vector<domain::DemandRecord>& rows,
                                                                        const std::string& sourceName) const;
    void publish(std::shared_ptr<const domain::forecasting::TrainedModel> model);
    DemandPrediction predictWith(const domain::forecasting::TrainedModel& model,
                                 const std::string& bloodType,
                                 const std::string& region,
                                 domain::TimePoint forecastInstant) const;
    int currentInventoryFor(const std::string& bloodType, const std::string& region) const;
    void recordUnknownCategory(const std::string& column, const std::string& value) const;

    std::shared_ptr<domain::DemandDataSource> m_history;
    std::shared_ptr<domain::DemandDataSource> m_fallback;
    std::shared_ptr<infrastructure::ModelArtifactStore> m_artifacts;
    std::shared_ptr<domain::InventoryRepository> m_inventory;
    std::shared_ptr<AsyncTaskManager> m_tasks;
    ForecasterOptions m_options;

    mutable std::mutex m_modelMutex;
    mutable std::condition_variable m_readyCv;
    std::shared_ptr<const domain::forecasting::TrainedModel> m_model;
    std::string m_lastError;
    int m_pendingTasks = 0;                ///< trainAsync() runs not yet finished; guarded by m_modelMutex.
    std::condition_variable m_tasksIdleCv;

    std::mutex m_trainMutex;   ///< One training run at a time.
    std::atomic<bool> m_training{false};
    mutable std::atomic<long long> m_unknownCategories{0};
};

} // namespace hemoflow::application
