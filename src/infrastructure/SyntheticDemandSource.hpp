/**
 * @file SyntheticDemandSource.hpp
 * @brief Generated demand history with seasonal, regional and outbreak effects.
 */

#pragma once

#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "domain/DemandDataSource.hpp"

namespace hemoflow::infrastructure {

/**
 * @class SyntheticDemandSource
 * @brief Stand-in for real history: one row per (day, region, blood type).
 *
 * Demand = base weight x season multiplier x region factor x jitter(0.8..1.2),
 * x1.5 on a 10% outbreak draw in rain seasons, x0.9 on weekends.
 * Seeded, so two sources with the same seed produce the same rows.
 */
class SyntheticDemandSource : public domain::DemandDataSource {
public:
    explicit SyntheticDemandSource(unsigned seed = 7,
                                   std::vector<std::string> regions = {});

    std::vector<domain::DemandRecord> fetchHistory(int daysBack, domain::TimePoint end) override;
    std::string name() const override { return "synthetic"; }

    static double SeasonMultiplier(domain::Season season);

private:
    std::vector<std::string> m_regions;
    std::mt19937 m_rng;
    std::mutex m_mutex;
};

} // namespace hemoflow::infrastructure
