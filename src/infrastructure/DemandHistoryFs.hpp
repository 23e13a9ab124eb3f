/**
 * @file DemandHistoryFs.hpp
 * @brief File-system backed historical demand (one JSON record per line).
 */

#pragma once

#include <string>
#include <vector>
#include "domain/DemandDataSource.hpp"

namespace hemoflow::infrastructure {

class DemandHistoryFs : public domain::DemandDataSource {
public:
    explicit DemandHistoryFs(std::string path);

    /**
     * Reads every well-formed line whose date falls in [end - daysBack, end).
     * Malformed lines and negative unit counts are skipped with a warning.
     */
    std::vector<domain::DemandRecord> fetchHistory(int daysBack, domain::TimePoint end) override;
    std::string name() const override { return "history:" + m_path; }

    /** @brief Serializes one record as a single NDJSON line (no trailing newline). */
    static std::string toLine(const domain::DemandRecord& record);

private:
    std::string m_path;
};

} // namespace hemoflow::infrastructure
