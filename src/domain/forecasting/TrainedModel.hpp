/**
 * @file TrainedModel.hpp
 * @brief Encoder/regressor pair that forms one trained demand model.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "domain/Calendar.hpp"
#include "domain/forecasting/FeatureEncoder.hpp"
#include "domain/forecasting/RegressionForest.hpp"

namespace hemoflow::domain::forecasting {

/** @brief Column order of every feature row. */
inline const std::vector<std::string>& FeatureNames() {
    static const std::vector<std::string> names = {
        "blood_type_encoded", "region_encoded", "season_encoded",
        "day_of_week", "month", "disease_outbreak", "is_monsoon"
    };
    return names;
}

/**
 * @brief Outbreak flag used at prediction time.
 *
 * Outbreaks only occur in rain seasons, at a 10% rate. The draw is a hash of
 * (blood type, region, date) so repeated predictions for the same inputs agree.
 */
bool PredictedOutbreak(const std::string& bloodType, const std::string& region, const CalendarDate& date);

/**
 * @struct TrainedModel
 * @brief Immutable once published; encoders and forest always come from the same fit.
 */
struct TrainedModel {
    FeatureEncoder bloodTypeEncoder{"blood_type"};
    FeatureEncoder regionEncoder{"region"};
    FeatureEncoder seasonEncoder{"season"};
    RegressionForest forest;
    bool isTrained = false;

    // Metadata
    TimePoint trainedAt;
    size_t trainingRecords = 0;
    double trainingScore = 0.0;
    std::string dataSource;

    /**
     * @brief Encodes one observation into a feature row in FeatureNames() order.
     * @param seasonTag Season name as produced by SeasonToString().
     * @param onUnknown Invoked for categorical values the encoders never saw.
     */
    FeatureRow featuresFor(const std::string& bloodType,
                           const std::string& region,
                           const std::string& seasonTag,
                           const CalendarDate& date,
                           bool outbreak,
                           const UnknownCategoryHandler& onUnknown = nullptr) const;
};

} // namespace hemoflow::domain::forecasting
