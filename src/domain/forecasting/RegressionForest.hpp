/**
 * @file RegressionForest.hpp
 * @brief Bagged ensemble of regression trees used as the demand model.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hemoflow::domain::forecasting {

using FeatureRow = std::vector<double>;
using FeatureMatrix = std::vector<FeatureRow>;

/**
 * @struct ForestParams
 * @brief Training hyper-parameters.
 */
struct ForestParams {
    int numTrees = 100;
    int maxDepth = 10;
    int minSamplesSplit = 2;
    int minSamplesLeaf = 1;
    std::uint32_t seed = 42;
};

/**
 * @struct TreeNode
 * @brief Flat tree node. Leaves have left == right == -1.
 */
struct TreeNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    double value = 0.0;   ///< Mean target of the training rows that reached this node.

    bool isLeaf() const { return left < 0 && right < 0; }
};

struct RegressionTree {
    std::vector<TreeNode> nodes;   ///< nodes[0] is the root.

    double predict(const FeatureRow& x) const;
};

/**
 * @class RegressionForest
 * @brief Random-forest regressor: bootstrap sampling, variance-reduction splits, mean aggregation.
 *
 * Each tree draws from its own generator seeded with (seed + tree index), so a
 * fit is reproducible regardless of how trees are scheduled across threads.
 */
class RegressionForest {
public:
    RegressionForest() = default;
    explicit RegressionForest(ForestParams params) : m_params(params) {}

    /**
     * @brief Rebuilds a fitted forest from persisted trees.
     * @throws ArtifactError if a node references a missing child or feature.
     */
    static RegressionForest fromTrees(ForestParams params, size_t featureCount, std::vector<RegressionTree> trees);

    /**
     * @brief Fits the ensemble.
     * @throws InvalidArgument on empty or ragged input.
     */
    void fit(const FeatureMatrix& x, const std::vector<double>& y);

    /** @brief Mean of the per-tree predictions. */
    double predict(const FeatureRow& x) const;

    /** @brief One prediction per estimator, used for uncertainty. */
    std::vector<double> predictPerTree(const FeatureRow& x) const;

    /** @brief Coefficient of determination (R^2) on the given rows. */
    double score(const FeatureMatrix& x, const std::vector<double>& y) const;

    bool isFitted() const { return !m_trees.empty(); }
    size_t featureCount() const { return m_featureCount; }
    const ForestParams& params() const { return m_params; }
    const std::vector<RegressionTree>& trees() const { return m_trees; }

private:
    void checkRow(const FeatureRow& x) const;

    ForestParams m_params;
    size_t m_featureCount = 0;
    std::vector<RegressionTree> m_trees;
};

} // namespace hemoflow::domain::forecasting
