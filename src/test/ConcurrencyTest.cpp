#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/DemandForecaster.hpp"
#include "application/Redistributor.hpp"
#include "domain/BloodTypes.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/JsonInventoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SyntheticDemandSource.hpp"

using namespace hemoflow::domain;
using namespace hemoflow::application;
using namespace hemoflow::infrastructure;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    auto persistence = std::make_shared<PersistenceService>();
    auto repo = std::make_shared<JsonInventoryRepository>("", persistence);
    Redistributor redistributor(repo);

    // Hospital 1 holds 100 units; many threads race to drain it into two destinations,
    // and some threads move units back the other way.
    redistributor.setCurrentUnits(1, "O+", 100, "Source");
    redistributor.setCurrentUnits(2, "O+", 0, "Sink A");
    redistributor.setCurrentUnits(3, "O+", 0, "Sink B");

    const int NUM_THREADS = 16;
    const int ATTEMPTS = 40;
    std::atomic<int> moved{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    std::cout << "[Test] Spawning " << NUM_THREADS << " threads executing transfers..." << std::endl;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            const int to = (t % 2 == 0) ? 2 : 3;
            for (int i = 0; i < ATTEMPTS; ++i) {
                try {
                    if (t % 4 == 3) {
                        redistributor.executeRedistribution(to, 1, "O+", 1);
                        moved -= 1;
                    } else {
                        redistributor.executeRedistribution(1, to, "O+", 1);
                        moved += 1;
                    }
                } catch (const InsufficientInventory&) {
                    rejected++;
                } catch (const CapacityExceeded&) {
                    rejected++;
                }
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    const int source = repo->find(1, "O+")->currentUnits;
    const int sinkA = repo->find(2, "O+")->currentUnits;
    const int sinkB = repo->find(3, "O+")->currentUnits;
    std::cout << "[Test] Levels after race: " << source << " / " << sinkA << " / " << sinkB
              << " (" << rejected << " rejected)" << std::endl;

    assert(source >= 0 && sinkA >= 0 && sinkB >= 0);
    assert(source + sinkA + sinkB == 100);
    assert(source == 100 - moved);
    std::cout << "[PASS] Concurrent transfers conserve units and never overdraw." << std::endl;

    // Predictions keep being served while a retrain replaces the model.
    auto tasks = std::make_shared<AsyncTaskManager>();
    ForecasterOptions options;
    options.trainingDaysBack = 45;
    options.forest.numTrees = 8;
    options.forest.maxDepth = 5;
    DemandForecaster forecaster(std::make_shared<SyntheticDemandSource>(11), nullptr, nullptr, repo, tasks, options);
    forecaster.train(true);
    assert(forecaster.isReady());

    std::atomic<bool> stop{false};
    std::atomic<int> predictions{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> readers;
    const TimePoint when = FromCalendarDate(2026, 10, 25);
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&, r]() {
            const auto& types = AllBloodTypes();
            size_t i = static_cast<size_t>(r);
            while (!stop) {
                try {
                    auto p = forecaster.predictDemand(types[i % types.size()], "Noida", when);
                    if (p.predictedUnits < 0.0 || p.confidence < 0.5 || p.confidence > 0.95) {
                        failures++;
                    }
                    predictions++;
                } catch (const EngineError&) {
                    failures++;
                }
                ++i;
            }
        });
    }

    auto retrain = forecaster.trainAsync(true);
    assert(retrain->waitFor(std::chrono::seconds(120)));
    assert(!retrain->failed);
    while (predictions == 0) {
        std::this_thread::yield();
    }
    stop = true;
    for (auto& t : readers) {
        t.join();
    }

    std::cout << "[Test] " << predictions << " predictions served during retrain" << std::endl;
    assert(failures == 0);
    assert(predictions > 0);
    assert(forecaster.state() == ModelState::Trained);
    std::cout << "[PASS] Model swap is invisible to concurrent readers." << std::endl;

    tasks->waitAll();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
