/**
 * @file RegressionForest.cpp
 * @brief Implementation of RegressionForest.
 */

#include "domain/forecasting/RegressionForest.hpp"
#include "domain/EngineErrors.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>

namespace hemoflow::domain::forecasting {

namespace {

struct Split {
    bool found = false;
    int feature = -1;
    double threshold = 0.0;
    double gain = 0.0;
};

/**
 * Grows one tree over a bootstrap sample. Shares the training matrix read-only,
 * so one builder serves all worker threads.
 */
class TreeBuilder {
public:
    TreeBuilder(const FeatureMatrix& x, const std::vector<double>& y, const ForestParams& params)
        : m_x(x), m_y(y), m_params(params) {}

    RegressionTree build(std::mt19937& rng) const {
        const size_t n = m_y.size();
        std::uniform_int_distribution<size_t> pick(0, n - 1);

        std::vector<size_t> sample(n);
        for (size_t i = 0; i < n; ++i) {
            sample[i] = pick(rng);
        }

        RegressionTree tree;
        grow(tree, sample, 0);
        return tree;
    }

private:
    int grow(RegressionTree& tree, std::vector<size_t>& rows, int depth) const {
        const int index = static_cast<int>(tree.nodes.size());
        tree.nodes.emplace_back();

        const double n = static_cast<double>(rows.size());
        double sum = 0.0, sumSq = 0.0;
        for (size_t r : rows) {
            sum += m_y[r];
            sumSq += m_y[r] * m_y[r];
        }
        tree.nodes[index].value = rows.empty() ? 0.0 : sum / n;

        const double sse = rows.empty() ? 0.0 : sumSq - sum * sum / n;
        if (depth >= m_params.maxDepth ||
            static_cast<int>(rows.size()) < m_params.minSamplesSplit ||
            sse <= 1e-9) {
            return index;
        }

        const Split split = findBestSplit(rows, sum, sumSq, sse);
        if (!split.found) {
            return index;
        }

        std::vector<size_t> left, right;
        left.reserve(rows.size());
        right.reserve(rows.size());
        for (size_t r : rows) {
            if (m_x[r][split.feature] <= split.threshold) left.push_back(r);
            else right.push_back(r);
        }
        std::vector<size_t>().swap(rows);

        // Children are appended after this node; write indices only after
        // recursion since push_back may reallocate the node vector.
        const int leftIndex = grow(tree, left, depth + 1);
        const int rightIndex = grow(tree, right, depth + 1);

        TreeNode& node = tree.nodes[index];
        node.feature = split.feature;
        node.threshold = split.threshold;
        node.left = leftIndex;
        node.right = rightIndex;
        return index;
    }

    Split findBestSplit(const std::vector<size_t>& rows, double totalSum, double totalSq, double parentSse) const {
        Split best;
        const size_t n = rows.size();
        const size_t minLeaf = static_cast<size_t>(std::max(1, m_params.minSamplesLeaf));
        const size_t featureCount = m_x.front().size();

        std::vector<std::pair<double, double>> column(n);
        for (size_t f = 0; f < featureCount; ++f) {
            for (size_t i = 0; i < n; ++i) {
                column[i] = {m_x[rows[i]][f], m_y[rows[i]]};
            }
            std::sort(column.begin(), column.end(),
                [](const auto& a, const auto& b) { return a.first < b.first; });

            double leftSum = 0.0, leftSq = 0.0;
            for (size_t i = 0; i + 1 < n; ++i) {
                leftSum += column[i].second;
                leftSq += column[i].second * column[i].second;

                if (column[i].first == column[i + 1].first) continue;

                const size_t nl = i + 1;
                const size_t nr = n - nl;
                if (nl < minLeaf || nr < minLeaf) continue;

                const double rightSum = totalSum - leftSum;
                const double rightSq = totalSq - leftSq;
                const double childSse = (leftSq - leftSum * leftSum / nl) +
                                        (rightSq - rightSum * rightSum / nr);
                const double gain = parentSse - childSse;

                if (gain > best.gain + 1e-12) {
                    best.found = true;
                    best.feature = static_cast<int>(f);
                    best.threshold = (column[i].first + column[i + 1].first) / 2.0;
                    best.gain = gain;
                }
            }
        }
        return best;
    }

    const FeatureMatrix& m_x;
    const std::vector<double>& m_y;
    const ForestParams& m_params;
};

} // namespace

double RegressionTree::predict(const FeatureRow& x) const {
    if (nodes.empty()) return 0.0;
    int i = 0;
    while (!nodes[i].isLeaf()) {
        const TreeNode& node = nodes[i];
        i = (x[node.feature] <= node.threshold) ? node.left : node.right;
    }
    return nodes[i].value;
}

RegressionForest RegressionForest::fromTrees(ForestParams params, size_t featureCount, std::vector<RegressionTree> trees) {
    for (size_t t = 0; t < trees.size(); ++t) {
        const auto& nodes = trees[t].nodes;
        if (nodes.empty()) {
            throw ArtifactError("Tree " + std::to_string(t) + " has no nodes");
        }
        const int count = static_cast<int>(nodes.size());
        for (int i = 0; i < count; ++i) {
            const TreeNode& node = nodes[i];
            if (node.isLeaf()) continue;
            // Children always follow their parent, which also rules out cycles.
            if (node.left <= i || node.left >= count || node.right <= i || node.right >= count) {
                throw ArtifactError("Tree " + std::to_string(t) + " references a missing child node");
            }
            if (node.feature < 0 || static_cast<size_t>(node.feature) >= featureCount) {
                throw ArtifactError("Tree " + std::to_string(t) + " splits on an unknown feature");
            }
        }
    }

    RegressionForest forest(params);
    forest.m_featureCount = featureCount;
    forest.m_trees = std::move(trees);
    return forest;
}

void RegressionForest::fit(const FeatureMatrix& x, const std::vector<double>& y) {
    if (x.empty() || x.size() != y.size()) {
        throw InvalidArgument("Training data must be non-empty with one target per row");
    }
    const size_t featureCount = x.front().size();
    if (featureCount == 0) {
        throw InvalidArgument("Training rows have no features");
    }
    for (const auto& row : x) {
        if (row.size() != featureCount) {
            throw InvalidArgument("Training rows have inconsistent feature counts");
        }
    }
    if (m_params.numTrees <= 0) {
        throw InvalidArgument("Forest needs at least one tree");
    }

    const int numTrees = m_params.numTrees;
    std::vector<RegressionTree> trees(numTrees);
    TreeBuilder builder(x, y, m_params);

    const unsigned hw = std::max(1u, std::thread::hardware_concurrency());
    const unsigned workerCount = std::min<unsigned>(hw, static_cast<unsigned>(numTrees));

    std::atomic<int> next{0};
    std::exception_ptr failure;
    std::mutex failureMutex;

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (unsigned w = 0; w < workerCount; ++w) {
        workers.emplace_back([&]() {
            try {
                for (int t = next++; t < numTrees; t = next++) {
                    std::mt19937 rng(m_params.seed + static_cast<std::uint32_t>(t));
                    trees[t] = builder.build(rng);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(failureMutex);
                if (!failure) failure = std::current_exception();
                next = numTrees;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    m_featureCount = featureCount;
    m_trees = std::move(trees);
}

void RegressionForest::checkRow(const FeatureRow& x) const {
    if (m_trees.empty()) {
        throw ModelNotReady("Regression forest has not been fitted");
    }
    if (x.size() != m_featureCount) {
        throw InvalidArgument("Expected " + std::to_string(m_featureCount) +
                              " features, got " + std::to_string(x.size()));
    }
}

double RegressionForest::predict(const FeatureRow& x) const {
    checkRow(x);
    double sum = 0.0;
    for (const auto& tree : m_trees) {
        sum += tree.predict(x);
    }
    return sum / static_cast<double>(m_trees.size());
}

std::vector<double> RegressionForest::predictPerTree(const FeatureRow& x) const {
    checkRow(x);
    std::vector<double> out;
    out.reserve(m_trees.size());
    for (const auto& tree : m_trees) {
        out.push_back(tree.predict(x));
    }
    return out;
}

double RegressionForest::score(const FeatureMatrix& x, const std::vector<double>& y) const {
    if (x.empty() || x.size() != y.size()) {
        throw InvalidArgument("Scoring data must be non-empty with one target per row");
    }
    double mean = 0.0;
    for (double v : y) mean += v;
    mean /= static_cast<double>(y.size());

    double ssRes = 0.0, ssTot = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double diff = y[i] - predict(x[i]);
        ssRes += diff * diff;
        ssTot += (y[i] - mean) * (y[i] - mean);
    }
    if (ssTot <= 0.0) {
        return ssRes <= 0.0 ? 1.0 : 0.0;
    }
    return 1.0 - ssRes / ssTot;
}

} // namespace hemoflow::domain::forecasting
