/**
 * @file FeatureEncoder.cpp
 * @brief Implementation of FeatureEncoder.
 */

#include "domain/forecasting/FeatureEncoder.hpp"
#include "domain/EngineErrors.hpp"

namespace hemoflow::domain::forecasting {

FeatureEncoder FeatureEncoder::fromClasses(std::string column, const std::vector<std::string>& classes) {
    FeatureEncoder encoder(std::move(column));
    for (const auto& value : classes) {
        if (encoder.contains(value)) {
            throw ArtifactError("Duplicate class '" + value + "' in encoder " + encoder.m_column);
        }
        encoder.m_codes[value] = static_cast<int>(encoder.m_classes.size());
        encoder.m_classes.push_back(value);
    }
    return encoder;
}

void FeatureEncoder::fit(const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (m_codes.find(value) != m_codes.end()) continue;
        m_codes[value] = static_cast<int>(m_classes.size());
        m_classes.push_back(value);
    }
}

int FeatureEncoder::encode(const std::string& value, const UnknownCategoryHandler& onUnknown) const {
    auto it = m_codes.find(value);
    if (it != m_codes.end()) {
        return it->second;
    }
    if (onUnknown) {
        onUnknown(m_column, value);
    }
    return kFallbackCode;
}

bool FeatureEncoder::contains(const std::string& value) const {
    return m_codes.find(value) != m_codes.end();
}

} // namespace hemoflow::domain::forecasting
