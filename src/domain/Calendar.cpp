/**
 * @file Calendar.cpp
 * @brief Implementation of the calendar helpers.
 */

#include "domain/Calendar.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace hemoflow::domain {

namespace {

// Days since 1970-01-01 to civil date, proleptic Gregorian.
void CivilFromDays(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

long long DaysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

long long FloorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

CalendarDate ToCalendarDate(TimePoint tp) {
    const long long secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    const long long days = FloorDiv(secs, 86400);

    CalendarDate date;
    CivilFromDays(days, date.year, date.month, date.day);
    // 1970-01-01 was a Thursday (3 with Monday = 0).
    long long wd = (days + 3) % 7;
    if (wd < 0) wd += 7;
    date.weekday = static_cast<int>(wd);
    return date;
}

TimePoint FromCalendarDate(int year, int month, int day) {
    const long long days = DaysFromCivil(year, month, day);
    return TimePoint(std::chrono::seconds(days * 86400));
}

std::string FormatTimestamp(TimePoint tp) {
    const long long secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    const long long days = FloorDiv(secs, 86400);
    const long long rem = secs - days * 86400;
    const CalendarDate date = ToCalendarDate(tp);

    std::ostringstream os;
    os << std::setfill('0')
       << std::setw(4) << date.year << '-'
       << std::setw(2) << date.month << '-'
       << std::setw(2) << date.day << ' '
       << std::setw(2) << rem / 3600 << ':'
       << std::setw(2) << (rem % 3600) / 60;
    return os.str();
}

bool ParseDate(const std::string& text, TimePoint& out) {
    int y = 0, m = 0, d = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%d", &y, &m, &d) != 3) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return false;
    }
    out = FromCalendarDate(y, m, d);
    return true;
}

Season SeasonForMonth(int month) {
    switch (month) {
        case 12: case 1: case 2: return Season::Winter;
        case 3: case 4: case 5: return Season::Summer;
        case 6: case 7: case 8: case 9: return Season::Monsoon;
        default: return Season::PostMonsoon;
    }
}

std::string SeasonToString(Season season) {
    switch (season) {
        case Season::Winter: return "Winter";
        case Season::Summer: return "Summer";
        case Season::Monsoon: return "Monsoon";
        case Season::PostMonsoon: return "Post-Monsoon";
    }
    return "Winter";
}

bool IsRainSeason(Season season) {
    return season == Season::Monsoon || season == Season::PostMonsoon;
}

} // namespace hemoflow::domain
