/**
 * @file Calendar.hpp
 * @brief UTC calendar decomposition and the seasonal model used for demand.
 */

#pragma once

#include <chrono>
#include <string>

namespace hemoflow::domain {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @struct CalendarDate
 * @brief Civil date of a time point, in UTC.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;      ///< 1..12
    int day = 1;        ///< 1..31
    int weekday = 3;    ///< 0 = Monday .. 6 = Sunday
};

/**
 * @enum Season
 * @brief Four-season climate model. PostMonsoon follows the heavy-rain months.
 */
enum class Season {
    Winter,
    Summer,
    Monsoon,
    PostMonsoon
};

CalendarDate ToCalendarDate(TimePoint tp);

/** @brief Midnight UTC of the given civil date. */
TimePoint FromCalendarDate(int year, int month, int day);

/** @brief Formats as YYYY-MM-DD HH:MM (UTC). */
std::string FormatTimestamp(TimePoint tp);

/** @brief Parses YYYY-MM-DD, optionally followed by a time part that is ignored. */
bool ParseDate(const std::string& text, TimePoint& out);

Season SeasonForMonth(int month);
std::string SeasonToString(Season season);

/** @brief Monsoon and PostMonsoon, the seasons in which outbreaks occur. */
bool IsRainSeason(Season season);

/** @brief Saturday or Sunday. */
inline bool IsWeekend(const CalendarDate& date) { return date.weekday >= 5; }

} // namespace hemoflow::domain
