/**
 * @file FeatureEncoder.hpp
 * @brief Bijection between a categorical vocabulary and dense integer codes.
 */

#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hemoflow::domain::forecasting {

/**
 * @brief Called with (column, value) when encode() falls back for an unseen value.
 */
using UnknownCategoryHandler = std::function<void(const std::string&, const std::string&)>;

/**
 * @class FeatureEncoder
 * @brief Label encoder for one categorical column (blood type, region or season).
 *
 * Codes are assigned in first-seen order starting at 0. Values unseen during
 * fit() encode to kFallbackCode instead of failing.
 */
class FeatureEncoder {
public:
    static constexpr int kFallbackCode = 0;

    FeatureEncoder() = default;
    explicit FeatureEncoder(std::string column) : m_column(std::move(column)) {}

    /**
     * @brief Rebuilds an encoder from persisted classes; classes[i] receives code i.
     * @throws ArtifactError if the list contains duplicates.
     */
    static FeatureEncoder fromClasses(std::string column, const std::vector<std::string>& classes);

    /**
     * @brief Assigns the next unused code to every value not yet known.
     *
     * Refitting with values already seen changes nothing.
     */
    void fit(const std::vector<std::string>& values);

    /**
     * @brief Returns the code for @p value, or kFallbackCode when it was never fitted.
     * @param onUnknown Optional diagnostic hook invoked on fallback.
     */
    int encode(const std::string& value, const UnknownCategoryHandler& onUnknown = nullptr) const;

    bool contains(const std::string& value) const;
    size_t size() const { return m_classes.size(); }
    bool empty() const { return m_classes.empty(); }

    /** @brief Known values ordered by code. */
    const std::vector<std::string>& classes() const { return m_classes; }
    const std::string& column() const { return m_column; }

private:
    std::string m_column;
    std::vector<std::string> m_classes;
    std::unordered_map<std::string, int> m_codes;
};

} // namespace hemoflow::domain::forecasting
