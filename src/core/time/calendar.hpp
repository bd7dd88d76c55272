#pragma once

#include <optional>
#include <string>

namespace taskpilot::core::time {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool is_leap_year(int year);
int days_in_month(int year, int month);
bool is_valid(const CalendarDate& date);

// Strict YYYY-MM-DD.
std::optional<CalendarDate> parse_iso_date(const std::string& text);
std::string format_iso_date(const CalendarDate& date);

// Accepts YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, YYYYMMDD and YYYY年M月D日;
// returns the canonical YYYY-MM-DD form.
std::optional<std::string> normalize_date(const std::string& text);

CalendarDate first_day_of_month(int year, int month);
CalendarDate last_day_of_month(int year, int month);

CalendarDate system_today();

}  // namespace taskpilot::core::time
