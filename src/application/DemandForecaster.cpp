/**
 * @file DemandForecaster.cpp
 * @brief Implementation of DemandForecaster.
 */

#include "application/DemandForecaster.hpp"
#include "domain/BloodTypes.hpp"
#include "domain/EngineErrors.hpp"
#include "domain/forecasting/ShortageRiskPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace hemoflow::application {

using namespace hemoflow::domain;
using namespace hemoflow::domain::forecasting;

std::string ModelStateToString(ModelState state) {
    switch (state) {
        case ModelState::Untrained: return "Untrained";
        case ModelState::Training: return "Training";
        case ModelState::Trained: return "Trained";
    }
    return "Untrained";
}

DemandForecaster::DemandForecaster(std::shared_ptr<DemandDataSource> history,
                                   std::shared_ptr<DemandDataSource> fallback,
                                   std::shared_ptr<infrastructure::ModelArtifactStore> artifacts,
                                   std::shared_ptr<InventoryRepository> inventory,
                                   std::shared_ptr<AsyncTaskManager> tasks,
                                   ForecasterOptions options)
    : m_history(std::move(history)),
      m_fallback(std::move(fallback)),
      m_artifacts(std::move(artifacts)),
      m_inventory(std::move(inventory)),
      m_tasks(std::move(tasks)),
      m_options(std::move(options)) {
    if (m_options.regions.empty()) {
        m_options.regions = DefaultRegions();
    }
}

DemandForecaster::~DemandForecaster() {
    std::unique_lock<std::mutex> lock(m_modelMutex);
    m_tasksIdleCv.wait(lock, [this] { return m_pendingTasks == 0; });
}

bool DemandForecaster::loadPersistedModel() {
    if (!m_artifacts || !m_artifacts->exists()) {
        return false;
    }
    try {
        publish(m_artifacts->load());
        std::cout << "[DemandForecaster] Loaded existing demand model from " << m_artifacts->path() << std::endl;
        return true;
    } catch (const ArtifactError& e) {
        std::cerr << "[DemandForecaster] Could not load existing model: " << e.what() << std::endl;
        return false;
    }
}

void DemandForecaster::train(bool forceRetrain) {
    std::lock_guard<std::mutex> trainLock(m_trainMutex);

    if (!forceRetrain && loadPersistedModel()) {
        return;
    }

    m_training = true;
    struct TrainingFlag {
        std::atomic<bool>& flag;
        ~TrainingFlag() { flag = false; }
    } resetFlag{m_training};

    try {
        std::cout << "[DemandForecaster] Training demand forecasting model..." << std::endl;

        const TimePoint end = std::chrono::system_clock::now();
        std::vector<DemandRecord> rows;
        std::string sourceName;
        if (m_history) {
            rows = m_history->fetchHistory(m_options.trainingDaysBack, end);
            sourceName = m_history->name();
        }
        if (rows.empty() && m_fallback) {
            std::cout << "[DemandForecaster] No historical demand available, using "
                      << m_fallback->name() << " data" << std::endl;
            rows = m_fallback->fetchHistory(m_options.trainingDaysBack, end);
            sourceName = m_fallback->name();
        }
        if (rows.empty()) {
            throw EngineError("No training data available");
        }

        auto model = fitModel(rows, sourceName);

        // Persist first: a model that cannot be written is not published.
        if (m_artifacts) {
            m_artifacts->save(*model);
            std::cout << "[DemandForecaster] Model saved to " << m_artifacts->path() << std::endl;
        }

        std::cout << "[DemandForecaster] Model trained on " << model->trainingRecords
                  << " historical records, training score " << model->trainingScore << std::endl;
        publish(std::move(model));
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(m_modelMutex);
            m_lastError = e.what();
        }
        std::cerr << "[DemandForecaster] Training failed: " << e.what() << std::endl;
        throw;
    }
}

std::shared_ptr<TaskStatus> DemandForecaster::trainAsync(bool forceRetrain) {
    if (!m_tasks) {
        throw InvalidArgument("No task manager configured for background training");
    }
    {
        std::lock_guard<std::mutex> lock(m_modelMutex);
        ++m_pendingTasks;
    }
    // The destructor blocks until the count drops, so the task may use `this`
    // until the guard below releases it.
    struct PendingTask {
        DemandForecaster* self;
        ~PendingTask() {
            std::lock_guard<std::mutex> lock(self->m_modelMutex);
            --self->m_pendingTasks;
            self->m_tasksIdleCv.notify_all();
        }
    };
    try {
        return m_tasks->SubmitTask(TaskType::Training, "Train demand model",
            [this](std::shared_ptr<TaskStatus> status, bool force) {
                PendingTask pending{this};
                status->progress = 0.1f;
                train(force);
            }, forceRetrain);
    } catch (const std::exception&) {
        // No thread was started, so nothing else will release the count.
        PendingTask pending{this};
        throw;
    }
}

std::shared_ptr<const TrainedModel> DemandForecaster::fitModel(const std::vector<DemandRecord>& rows,
                                                               const std::string& sourceName) const {
    auto model = std::make_shared<TrainedModel>();

    std::vector<std::string> bloodTypes, regions, seasons;
    bloodTypes.reserve(rows.size());
    regions.reserve(rows.size());
    seasons.reserve(rows.size());
    for (const auto& row : rows) {
        bloodTypes.push_back(row.bloodType);
        regions.push_back(row.region);
        seasons.push_back(row.season.empty()
            ? SeasonToString(SeasonForMonth(ToCalendarDate(row.date).month))
            : row.season);
    }
    model->bloodTypeEncoder.fit(bloodTypes);
    model->regionEncoder.fit(regions);
    model->seasonEncoder.fit(seasons);

    FeatureMatrix x;
    std::vector<double> y;
    x.reserve(rows.size());
    y.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        x.push_back(model->featuresFor(row.bloodType, row.region, seasons[i],
                                       ToCalendarDate(row.date), row.outbreak));
        y.push_back(static_cast<double>(std::max(0, row.unitsConsumed)));
    }

    model->forest = RegressionForest(m_options.forest);
    model->forest.fit(x, y);
    model->trainingScore = model->forest.score(x, y);
    model->trainingRecords = rows.size();
    model->trainedAt = std::chrono::system_clock::now();
    model->dataSource = sourceName;
    model->isTrained = true;
    return model;
}

void DemandForecaster::publish(std::shared_ptr<const TrainedModel> model) {
    {
        std::lock_guard<std::mutex> lock(m_modelMutex);
        m_model = std::move(model);
        m_lastError.clear();
    }
    m_readyCv.notify_all();
}

std::shared_ptr<const TrainedModel> DemandForecaster::currentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

bool DemandForecaster::waitUntilReady(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_modelMutex);
    return m_readyCv.wait_for(lock, timeout, [this] { return m_model != nullptr; });
}

bool DemandForecaster::isReady() const {
    return currentModel() != nullptr;
}

ModelState DemandForecaster::state() const {
    if (isReady()) return ModelState::Trained;
    return m_training ? ModelState::Training : ModelState::Untrained;
}

TrainingStatus DemandForecaster::status() const {
    TrainingStatus s;
    std::shared_ptr<const TrainedModel> model;
    {
        std::lock_guard<std::mutex> lock(m_modelMutex);
        model = m_model;
        s.lastError = m_lastError;
    }
    s.state = state();
    s.isTrained = model != nullptr;
    s.isTraining = m_training;
    s.modelExists = m_artifacts && m_artifacts->exists();
    s.unknownCategoryCount = m_unknownCategories;
    if (model) {
        s.lastTrained = model->trainedAt;
        s.trainingRecords = model->trainingRecords;
        s.trainingScore = model->trainingScore;
        s.dataSource = model->dataSource;
    }
    return s;
}

void DemandForecaster::recordUnknownCategory(const std::string& column, const std::string& value) const {
    m_unknownCategories++;
    std::cerr << "[DemandForecaster] Unknown " << column << " '" << value
              << "', using fallback code " << FeatureEncoder::kFallbackCode << std::endl;
}

DemandPrediction DemandForecaster::predictDemand(const std::string& bloodType,
                                                 const std::string& region,
                                                 TimePoint forecastInstant) const {
    auto model = currentModel();
    if (!model || !model->isTrained) {
        throw ModelNotReady();
    }
    return predictWith(*model, bloodType, region, forecastInstant);
}

DemandPrediction DemandForecaster::predictWith(const TrainedModel& model,
                                               const std::string& bloodType,
                                               const std::string& region,
                                               TimePoint forecastInstant) const {
    const CalendarDate date = ToCalendarDate(forecastInstant);
    const std::string season = SeasonToString(SeasonForMonth(date.month));
    const bool outbreak = PredictedOutbreak(bloodType, region, date);

    const FeatureRow features = model.featuresFor(bloodType, region, season, date, outbreak,
        [this](const std::string& column, const std::string& value) {
            recordUnknownCategory(column, value);
        });

    const std::vector<double> perTree = model.forest.predictPerTree(features);
    double mean = 0.0;
    for (double p : perTree) mean += p;
    mean /= static_cast<double>(perTree.size());

    double variance = 0.0;
    for (double p : perTree) variance += (p - mean) * (p - mean);
    const double stdDev = std::sqrt(variance / static_cast<double>(perTree.size()));

    DemandPrediction prediction;
    prediction.predictedUnits = std::max(0.0, mean);
    const double raw = prediction.predictedUnits > 0.0
        ? 1.0 - stdDev / prediction.predictedUnits
        : kZeroDemandConfidence;
    prediction.confidence = std::clamp(raw, kMinConfidence, kMaxConfidence);
    return prediction;
}

RiskLevel DemandForecaster::assessShortageRisk(double predictedDemand, int currentInventory) {
    return ShortageRiskPolicy::assess(predictedDemand, currentInventory);
}

int DemandForecaster::currentInventoryFor(const std::string& bloodType, const std::string& region) const {
    if (!m_inventory) {
        return m_options.defaultInventoryUnits;
    }
    InventoryFilter filter;
    filter.bloodType = bloodType;
    filter.region = region;
    const auto cells = m_inventory->findAll(filter);
    if (cells.empty()) {
        return m_options.defaultInventoryUnits;
    }
    int total = 0;
    for (const auto& cell : cells) {
        total += cell.currentUnits;
    }
    return total;
}

std::vector<DemandForecast> DemandForecaster::generateForecasts(int horizonHours,
                                                                const std::vector<std::string>& regions,
                                                                std::optional<TimePoint> now) const {
    // One snapshot for the whole batch so a concurrent retrain cannot mix models.
    const auto model = currentModel();
    if (!model || !model->isTrained) {
        throw ModelNotReady("Model must be trained before generating forecasts");
    }
    if (horizonHours < 1 || horizonHours > kMaxHorizonHours) {
        throw InvalidArgument("Forecast horizon must be between 1 and 168 hours");
    }

    const auto& targetRegions = regions.empty() ? m_options.regions : regions;
    const TimePoint forecastDate = now.value_or(std::chrono::system_clock::now()) +
                                   std::chrono::hours(horizonHours);

    std::vector<DemandForecast> forecasts;
    forecasts.reserve(targetRegions.size() * AllBloodTypes().size());

    for (const auto& region : targetRegions) {
        for (const auto& bloodType : AllBloodTypes()) {
            try {
                const int inventory = currentInventoryFor(bloodType, region);
                const DemandPrediction prediction = predictWith(*model, bloodType, region, forecastDate);

                DemandForecast forecast;
                forecast.bloodType = bloodType;
                forecast.region = region;
                forecast.forecastDate = forecastDate;
                forecast.predictedDemand = prediction.predictedUnits;
                forecast.confidence = prediction.confidence;
                forecast.currentInventory = inventory;
                forecast.shortageRisk = assessShortageRisk(prediction.predictedUnits, inventory);
                forecast.alertSent = false;
                forecasts.push_back(std::move(forecast));
            } catch (const std::exception& e) {
                std::cerr << "[DemandForecaster] Error generating forecast for " << bloodType
                          << " in " << region << ": " << e.what() << std::endl;
            }
        }
    }
    return forecasts;
}

ForecastSummary DemandForecaster::summarizeForecasts(const std::vector<DemandForecast>& forecasts) {
    ForecastSummary summary;
    summary.totalForecasts = forecasts.size();
    for (RiskLevel level : {RiskLevel::Low, RiskLevel::Medium, RiskLevel::High, RiskLevel::Critical}) {
        summary.riskCounts[level] = 0;
    }
    for (const auto& f : forecasts) {
        summary.riskCounts[f.shortageRisk]++;
        summary.regionsCovered.insert(f.region);
        summary.bloodTypesCovered.insert(f.bloodType);
    }
    return summary;
}

std::vector<ShortageAlert> DemandForecaster::composeShortageAlerts(std::vector<DemandForecast>& forecasts,
                                                                   RiskLevel minRisk,
                                                                   TimePoint now) {
    std::vector<ShortageAlert> alerts;
    for (auto& f : forecasts) {
        if (f.alertSent || !IsAtLeast(f.shortageRisk, minRisk) || f.forecastDate <= now) {
            continue;
        }

        ShortageAlert alert;
        alert.bloodType = f.bloodType;
        alert.region = f.region;
        alert.predictedDemand = f.predictedDemand;
        alert.shortageRisk = f.shortageRisk;
        alert.forecastDate = f.forecastDate;
        alert.message = RiskToString(f.shortageRisk) + " risk of " + f.bloodType + " shortage in " +
                        f.region + " predicted for " + FormatTimestamp(f.forecastDate) +
                        ". Expected demand: " + std::to_string(static_cast<int>(f.predictedDemand)) + " units.";
        alert.callToAction = "Please schedule a donation appointment if you are available.";
        alerts.push_back(std::move(alert));

        f.alertSent = true;
    }
    return alerts;
}

} // namespace hemoflow::application
