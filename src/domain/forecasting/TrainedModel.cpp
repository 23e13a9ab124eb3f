/**
 * @file TrainedModel.cpp
 * @brief Feature construction for TrainedModel.
 */

#include "domain/forecasting/TrainedModel.hpp"

#include <cstdint>

namespace hemoflow::domain::forecasting {

namespace {

std::uint64_t Fnv1a(const std::string& text, std::uint64_t hash = 1469598103934665603ULL) {
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace

bool PredictedOutbreak(const std::string& bloodType, const std::string& region, const CalendarDate& date) {
    if (!IsRainSeason(SeasonForMonth(date.month))) {
        return false;
    }
    std::uint64_t h = Fnv1a(bloodType);
    h = Fnv1a("|" + region, h);
    h = Fnv1a("|" + std::to_string(date.year) + "-" + std::to_string(date.month) + "-" + std::to_string(date.day), h);
    return (h % 100) < 10;
}

FeatureRow TrainedModel::featuresFor(const std::string& bloodType,
                                     const std::string& region,
                                     const std::string& seasonTag,
                                     const CalendarDate& date,
                                     bool outbreak,
                                     const UnknownCategoryHandler& onUnknown) const {
    const bool rainSeason = seasonTag == SeasonToString(Season::Monsoon) ||
                            seasonTag == SeasonToString(Season::PostMonsoon);
    return {
        static_cast<double>(bloodTypeEncoder.encode(bloodType, onUnknown)),
        static_cast<double>(regionEncoder.encode(region, onUnknown)),
        static_cast<double>(seasonEncoder.encode(seasonTag, onUnknown)),
        static_cast<double>(date.weekday),
        static_cast<double>(date.month),
        outbreak ? 1.0 : 0.0,
        rainSeason ? 1.0 : 0.0
    };
}

} // namespace hemoflow::domain::forecasting
