#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "domain/EngineErrors.hpp"
#include "domain/forecasting/RegressionForest.hpp"

using namespace hemoflow::domain;
using namespace hemoflow::domain::forecasting;

int main() {
    std::cout << "[Test] Starting RegressionForest Test..." << std::endl;

    // Step function on feature 0; feature 1 is noise-free but irrelevant.
    FeatureMatrix x;
    std::vector<double> y;
    for (int i = 0; i < 100; ++i) {
        x.push_back({static_cast<double>(i), static_cast<double>(i % 7)});
        y.push_back(i < 50 ? 10.0 : 30.0);
    }

    ForestParams params;
    params.numTrees = 12;
    params.maxDepth = 4;
    params.seed = 123;

    RegressionForest unfitted(params);
    bool threw = false;
    try {
        unfitted.predict({1.0, 2.0});
    } catch (const ModelNotReady&) {
        threw = true;
    }
    assert(threw);

    RegressionForest forest(params);
    forest.fit(x, y);
    assert(forest.isFitted());
    assert(forest.trees().size() == 12);
    assert(forest.featureCount() == 2);

    assert(std::fabs(forest.predict({10.0, 3.0}) - 10.0) < 1e-9);
    assert(std::fabs(forest.predict({90.0, 3.0}) - 30.0) < 1e-9);
    const auto perTree = forest.predictPerTree({5.0, 0.0});
    assert(perTree.size() == 12);
    for (double p : perTree) {
        assert(std::fabs(p - 10.0) < 1e-9);
    }
    assert(forest.score(x, y) > 0.95);
    std::cout << "[PASS] Forest learns a step function." << std::endl;

    RegressionForest again(params);
    again.fit(x, y);
    for (int i = 0; i < 100; i += 3) {
        FeatureRow row{i + 0.5, 1.0};
        assert(forest.predict(row) == again.predict(row));
    }
    std::cout << "[PASS] Same seed, same forest." << std::endl;

    threw = false;
    try {
        forest.predict({1.0});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        RegressionForest bad(params);
        bad.fit({{1.0, 2.0}, {3.0}}, {1.0, 2.0});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        RegressionForest bad(params);
        bad.fit({}, {});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Bad input rejected." << std::endl;

    // Rebuild from the fitted trees.
    auto rebuilt = RegressionForest::fromTrees(forest.params(), forest.featureCount(), forest.trees());
    assert(rebuilt.predict({42.0, 2.0}) == forest.predict({42.0, 2.0}));

    RegressionTree cyclic;
    cyclic.nodes.resize(3);
    cyclic.nodes[0].feature = 0;
    cyclic.nodes[0].left = 1;
    cyclic.nodes[0].right = 2;
    cyclic.nodes[1].feature = 0;
    cyclic.nodes[1].left = 0;   // points back at the root
    cyclic.nodes[1].right = 2;
    threw = false;
    try {
        RegressionForest::fromTrees(params, 2, {cyclic});
    } catch (const ArtifactError&) {
        threw = true;
    }
    assert(threw);

    RegressionTree unknownFeature;
    unknownFeature.nodes.resize(3);
    unknownFeature.nodes[0].feature = 5;
    unknownFeature.nodes[0].left = 1;
    unknownFeature.nodes[0].right = 2;
    threw = false;
    try {
        RegressionForest::fromTrees(params, 2, {unknownFeature});
    } catch (const ArtifactError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] fromTrees validates structure." << std::endl;

    std::cout << "[PASS] RegressionForest Test." << std::endl;
    return 0;
}
