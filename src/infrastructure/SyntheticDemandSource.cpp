/**
 * @file SyntheticDemandSource.cpp
 * @brief Implementation of SyntheticDemandSource.
 */

#include "infrastructure/SyntheticDemandSource.hpp"
#include "domain/BloodTypes.hpp"

#include <chrono>

namespace hemoflow::infrastructure {

using namespace hemoflow::domain;

SyntheticDemandSource::SyntheticDemandSource(unsigned seed, std::vector<std::string> regions)
    : m_regions(std::move(regions)), m_rng(seed) {
    if (m_regions.empty()) {
        m_regions = DefaultRegions();
    }
}

double SyntheticDemandSource::SeasonMultiplier(Season season) {
    switch (season) {
        case Season::Winter: return 1.0;
        case Season::Summer: return 0.9;
        case Season::Monsoon: return 1.3;
        case Season::PostMonsoon: return 1.8;   // Disease spike after the rains
    }
    return 1.0;
}

std::vector<DemandRecord> SyntheticDemandSource::fetchHistory(int daysBack, TimePoint end) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::uniform_real_distribution<double> regionFactor(0.8, 1.2);
    std::uniform_real_distribution<double> jitter(0.8, 1.2);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    const auto& types = AllBloodTypes();
    const auto& weights = BloodTypeDemandWeights();

    std::vector<DemandRecord> rows;
    if (daysBack <= 0) return rows;
    rows.reserve(static_cast<size_t>(daysBack) * m_regions.size() * types.size());

    const TimePoint start = end - std::chrono::hours(24 * daysBack);
    for (int day = 0; day < daysBack; ++day) {
        const TimePoint date = start + std::chrono::hours(24 * day);
        const CalendarDate cal = ToCalendarDate(date);
        const Season season = SeasonForMonth(cal.month);
        const double seasonal = SeasonMultiplier(season);

        for (const auto& region : m_regions) {
            const double regional = regionFactor(m_rng);

            for (size_t t = 0; t < types.size(); ++t) {
                double demand = weights[t] * 100.0 * seasonal * regional;
                demand *= jitter(m_rng);

                bool outbreak = false;
                if (IsRainSeason(season) && unit(m_rng) < 0.1) {
                    outbreak = true;
                    demand *= 1.5;
                }
                if (IsWeekend(cal)) {
                    demand *= 0.9;
                }

                DemandRecord record;
                record.bloodType = types[t];
                record.region = region;
                record.date = date;
                record.unitsConsumed = static_cast<int>(demand);
                record.season = SeasonToString(season);
                record.outbreak = outbreak;
                rows.push_back(std::move(record));
            }
        }
    }
    return rows;
}

} // namespace hemoflow::infrastructure
