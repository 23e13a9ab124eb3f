/**
 * @file ModelArtifactStore.hpp
 * @brief Persistence of the trained demand model as a single JSON artifact.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/forecasting/TrainedModel.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace hemoflow::infrastructure {

/**
 * @class ModelArtifactStore
 * @brief Reads and writes the encoder + forest pair under one well-known path.
 */
class ModelArtifactStore {
public:
    static constexpr int kSchemaVersion = 1;

    ModelArtifactStore(std::string path, std::shared_ptr<PersistenceService> persistence);

    bool exists() const;
    const std::string& path() const { return m_path; }

    /**
     * @brief Writes the artifact synchronously (temp file, then rename).
     * @throws domain::ArtifactError if the write fails.
     */
    void save(const domain::forecasting::TrainedModel& model);

    /**
     * @brief Reads and validates the artifact.
     * @throws domain::ArtifactError if the file is missing, malformed or inconsistent.
     */
    std::shared_ptr<const domain::forecasting::TrainedModel> load() const;

    static std::string serialize(const domain::forecasting::TrainedModel& model);
    static domain::forecasting::TrainedModel deserialize(const std::string& text);

private:
    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace hemoflow::infrastructure
