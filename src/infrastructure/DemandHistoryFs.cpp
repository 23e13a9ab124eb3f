/**
 * @file DemandHistoryFs.cpp
 * @brief Implementation of DemandHistoryFs.
 */

#include "infrastructure/DemandHistoryFs.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hemoflow::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace hemoflow::domain;

DemandHistoryFs::DemandHistoryFs(std::string path) : m_path(std::move(path)) {}

std::vector<DemandRecord> DemandHistoryFs::fetchHistory(int daysBack, TimePoint end) {
    std::vector<DemandRecord> results;
    std::error_code ec;
    if (m_path.empty() || !fs::exists(m_path, ec)) {
        return results;
    }

    const TimePoint start = end - std::chrono::hours(24 * std::max(0, daysBack));
    int skipped = 0;

    std::ifstream inFile(m_path);
    std::string line;
    while (std::getline(inFile, line)) {
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            DemandRecord record;
            record.bloodType = j.at("blood_type").get<std::string>();
            record.region = j.at("region").get<std::string>();
            record.unitsConsumed = j.at("units").get<int>();
            record.outbreak = j.value("outbreak", false);

            if (!ParseDate(j.at("date").get<std::string>(), record.date) || record.unitsConsumed < 0) {
                skipped++;
                continue;
            }
            record.season = j.value("season", SeasonToString(SeasonForMonth(ToCalendarDate(record.date).month)));

            if (record.date < start || record.date >= end) continue;
            results.push_back(std::move(record));
        } catch (const json::exception&) {
            skipped++;
        }
    }

    if (skipped > 0) {
        std::cerr << "[DemandHistoryFs] Skipped " << skipped << " malformed line(s) in " << m_path << std::endl;
    }
    return results;
}

std::string DemandHistoryFs::toLine(const DemandRecord& record) {
    const std::string stamp = FormatTimestamp(record.date);
    json j = {
        {"blood_type", record.bloodType},
        {"region", record.region},
        {"date", stamp.substr(0, 10)},
        {"units", record.unitsConsumed},
        {"season", record.season},
        {"outbreak", record.outbreak}
    };
    return j.dump();
}

} // namespace hemoflow::infrastructure
