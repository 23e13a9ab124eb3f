/**
 * @file BloodTypes.hpp
 * @brief Fixed categorical vocabularies shared by forecasting and redistribution.
 */

#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace hemoflow::domain {

/**
 * @brief The eight ABO/Rh combinations, in the order forecasts are emitted.
 */
inline const std::vector<std::string>& AllBloodTypes() {
    static const std::vector<std::string> types = {
        "O+", "A+", "B+", "AB+", "O-", "A-", "B-", "AB-"
    };
    return types;
}

/**
 * @brief Relative share of demand per blood type, aligned with AllBloodTypes().
 */
inline const std::vector<double>& BloodTypeDemandWeights() {
    static const std::vector<double> weights = {
        0.35, 0.30, 0.20, 0.05, 0.05, 0.03, 0.015, 0.005
    };
    return weights;
}

/** @brief Regions covered when the caller does not name any. */
inline const std::vector<std::string>& DefaultRegions() {
    static const std::vector<std::string> regions = {
        "South Delhi", "North Delhi", "East Delhi", "West Delhi",
        "Central Delhi", "Noida", "Gurgaon", "Dwarka"
    };
    return regions;
}

inline bool IsKnownBloodType(const std::string& bloodType) {
    const auto& types = AllBloodTypes();
    return std::find(types.begin(), types.end(), bloodType) != types.end();
}

} // namespace hemoflow::domain
