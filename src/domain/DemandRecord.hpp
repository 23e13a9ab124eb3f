/**
 * @file DemandRecord.hpp
 * @brief One historical observation of consumed blood units.
 */

#pragma once

#include <string>
#include "domain/Calendar.hpp"

namespace hemoflow::domain {

struct DemandRecord {
    std::string bloodType;
    std::string region;
    TimePoint date;
    int unitsConsumed = 0;     ///< Never negative.
    std::string season;        ///< Season tag as recorded by the source.
    bool outbreak = false;
};

} // namespace hemoflow::domain
