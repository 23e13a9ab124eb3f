/**
 * @file DemandDataSource.hpp
 * @brief Port for historical demand ingestion.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/DemandRecord.hpp"

namespace hemoflow::domain {

/**
 * @class DemandDataSource
 * @brief Supplies training rows. Real history and synthesized data sit behind the same interface.
 */
class DemandDataSource {
public:
    virtual ~DemandDataSource() = default;

    /**
     * @brief Returns observations covering the @p daysBack days that precede @p end.
     * @return Possibly empty; callers decide how to handle an empty history.
     */
    virtual std::vector<DemandRecord> fetchHistory(int daysBack, TimePoint end) = 0;

    /** @brief Short identifier recorded in the model artifact. */
    virtual std::string name() const = 0;
};

} // namespace hemoflow::domain
