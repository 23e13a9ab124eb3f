/**
 * @file ModelArtifactStore.cpp
 * @brief Implementation of ModelArtifactStore.
 */

#include "infrastructure/ModelArtifactStore.hpp"
#include "domain/EngineErrors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace hemoflow::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::ArtifactError;
using namespace domain::forecasting;

namespace {

json TreeToJson(const RegressionTree& tree) {
    // Columnar layout keeps the artifact compact.
    std::vector<int> feature, left, right;
    std::vector<double> threshold, value;
    for (const auto& node : tree.nodes) {
        feature.push_back(node.feature);
        threshold.push_back(node.threshold);
        left.push_back(node.left);
        right.push_back(node.right);
        value.push_back(node.value);
    }
    return {{"f", feature}, {"t", threshold}, {"l", left}, {"r", right}, {"v", value}};
}

RegressionTree TreeFromJson(const json& j) {
    auto feature = j.at("f").get<std::vector<int>>();
    auto threshold = j.at("t").get<std::vector<double>>();
    auto left = j.at("l").get<std::vector<int>>();
    auto right = j.at("r").get<std::vector<int>>();
    auto value = j.at("v").get<std::vector<double>>();

    const size_t n = feature.size();
    if (threshold.size() != n || left.size() != n || right.size() != n || value.size() != n) {
        throw ArtifactError("Tree columns have different lengths");
    }

    RegressionTree tree;
    tree.nodes.resize(n);
    for (size_t i = 0; i < n; ++i) {
        tree.nodes[i].feature = feature[i];
        tree.nodes[i].threshold = threshold[i];
        tree.nodes[i].left = left[i];
        tree.nodes[i].right = right[i];
        tree.nodes[i].value = value[i];
    }
    return tree;
}

} // namespace

ModelArtifactStore::ModelArtifactStore(std::string path, std::shared_ptr<PersistenceService> persistence)
    : m_path(std::move(path)), m_persistence(std::move(persistence)) {}

bool ModelArtifactStore::exists() const {
    std::error_code ec;
    return !m_path.empty() && fs::exists(m_path, ec);
}

std::string ModelArtifactStore::serialize(const TrainedModel& model) {
    const auto& p = model.forest.params();

    json trees = json::array();
    for (const auto& tree : model.forest.trees()) {
        trees.push_back(TreeToJson(tree));
    }

    json j;
    j["schema_version"] = kSchemaVersion;
    j["is_trained"] = model.isTrained;
    j["trained_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        model.trainedAt.time_since_epoch()).count();
    j["training_records"] = model.trainingRecords;
    j["training_score"] = model.trainingScore;
    j["data_source"] = model.dataSource;
    j["encoders"] = {
        {"blood_type", model.bloodTypeEncoder.classes()},
        {"region", model.regionEncoder.classes()},
        {"season", model.seasonEncoder.classes()}
    };
    j["forest"] = {
        {"params", {
            {"num_trees", p.numTrees},
            {"max_depth", p.maxDepth},
            {"min_samples_split", p.minSamplesSplit},
            {"min_samples_leaf", p.minSamplesLeaf},
            {"seed", p.seed}
        }},
        {"feature_count", model.forest.featureCount()},
        {"trees", trees}
    };
    return j.dump();
}

TrainedModel ModelArtifactStore::deserialize(const std::string& text) {
    try {
        json j = json::parse(text);

        if (j.value("schema_version", 0) != kSchemaVersion) {
            throw ArtifactError("Unsupported model artifact schema version");
        }

        TrainedModel model;
        model.isTrained = j.at("is_trained").get<bool>();
        model.trainedAt = domain::TimePoint(std::chrono::milliseconds(j.value("trained_at", 0LL)));
        model.trainingRecords = j.value("training_records", static_cast<size_t>(0));
        model.trainingScore = j.value("training_score", 0.0);
        model.dataSource = j.value("data_source", std::string());

        const auto& enc = j.at("encoders");
        model.bloodTypeEncoder = FeatureEncoder::fromClasses("blood_type", enc.at("blood_type").get<std::vector<std::string>>());
        model.regionEncoder = FeatureEncoder::fromClasses("region", enc.at("region").get<std::vector<std::string>>());
        model.seasonEncoder = FeatureEncoder::fromClasses("season", enc.at("season").get<std::vector<std::string>>());

        const auto& f = j.at("forest");
        const auto& fp = f.at("params");
        ForestParams params;
        params.numTrees = fp.value("num_trees", params.numTrees);
        params.maxDepth = fp.value("max_depth", params.maxDepth);
        params.minSamplesSplit = fp.value("min_samples_split", params.minSamplesSplit);
        params.minSamplesLeaf = fp.value("min_samples_leaf", params.minSamplesLeaf);
        params.seed = fp.value("seed", params.seed);

        const size_t featureCount = f.at("feature_count").get<size_t>();
        std::vector<RegressionTree> trees;
        for (const auto& t : f.at("trees")) {
            trees.push_back(TreeFromJson(t));
        }
        model.forest = RegressionForest::fromTrees(params, featureCount, std::move(trees));

        // The encoder/forest pair must come from one fit of the current feature layout.
        if (!model.isTrained || !model.forest.isFitted()) {
            throw ArtifactError("Model artifact is not marked as trained");
        }
        if (model.forest.featureCount() != FeatureNames().size()) {
            throw ArtifactError("Model artifact feature count does not match the feature layout");
        }
        if (model.bloodTypeEncoder.empty() || model.regionEncoder.empty() || model.seasonEncoder.empty()) {
            throw ArtifactError("Model artifact has an empty encoder");
        }
        return model;
    } catch (const json::exception& e) {
        throw ArtifactError(std::string("Malformed model artifact: ") + e.what());
    }
}

void ModelArtifactStore::save(const TrainedModel& model) {
    const std::string content = serialize(model);
    if (!m_persistence || !m_persistence->writeAtomically(m_path, content)) {
        throw ArtifactError("Could not write model artifact to " + m_path);
    }
}

std::shared_ptr<const TrainedModel> ModelArtifactStore::load() const {
    std::string content;
    {
        std::ifstream in(m_path, std::ios::binary);
        if (!in.is_open()) {
            throw ArtifactError("Could not open model artifact " + m_path);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        content = buffer.str();
    }
    return std::make_shared<const TrainedModel>(deserialize(content));
}

} // namespace hemoflow::infrastructure
