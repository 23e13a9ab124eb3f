/**
 * @file RiskLevel.hpp
 * @brief Ordinal shortage risk scale.
 */

#pragma once

#include <string>
#include <optional>

namespace hemoflow::domain {

/**
 * @enum RiskLevel
 * @brief Shortage risk, ordered from least to most severe.
 *
 * The underlying values carry the order, so levels compare with < and >=.
 */
enum class RiskLevel {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3
};

inline std::string RiskToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "Low";
        case RiskLevel::Medium: return "Medium";
        case RiskLevel::High: return "High";
        case RiskLevel::Critical: return "Critical";
    }
    return "Low";
}

/** @brief Parses "Low", "Medium", "High" or "Critical"; nullopt otherwise. */
inline std::optional<RiskLevel> RiskFromString(const std::string& name) {
    if (name == "Low") return RiskLevel::Low;
    if (name == "Medium") return RiskLevel::Medium;
    if (name == "High") return RiskLevel::High;
    if (name == "Critical") return RiskLevel::Critical;
    return std::nullopt;
}

/** @brief True when @p level is at least as severe as @p threshold. */
inline bool IsAtLeast(RiskLevel level, RiskLevel threshold) {
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

} // namespace hemoflow::domain
