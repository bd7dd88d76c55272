#include "core/time/calendar.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>
#include "core/text/text_utils.hpp"

namespace taskpilot::core::time {

namespace {

// Splits the text into its digit runs; any other separator is accepted.
std::vector<std::string> digit_groups(const std::string& text) {
    std::vector<std::string> groups;
    std::string current;
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            current.push_back(c);
            continue;
        }
        if (!current.empty()) {
            groups.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        groups.push_back(current);
    }
    return groups;
}

bool only_date_characters(const std::string& text) {
    static const std::string kSeparators = "-/.";
    static const std::string kCjkMarks[] = {"\xE5\xB9\xB4", "\xE6\x9C\x88", "\xE6\x97\xA5"};  // 年 月 日

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c)) != 0 ||
            kSeparators.find(c) != std::string::npos) {
            ++i;
            continue;
        }
        bool matched = false;
        for (const auto& mark : kCjkMarks) {
            if (text.compare(i, mark.size(), mark) == 0) {
                i += mark.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool is_leap_year(const int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(const int year, const int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool is_valid(const CalendarDate& date) {
    return date.year >= 1900 && date.year <= 9999 && date.month >= 1 &&
           date.month <= 12 && date.day >= 1 &&
           date.day <= days_in_month(date.year, date.month);
}

std::optional<CalendarDate> parse_iso_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            return std::nullopt;
        }
    }
    CalendarDate date{std::stoi(text.substr(0, 4)), std::stoi(text.substr(5, 2)),
                      std::stoi(text.substr(8, 2))};
    if (!is_valid(date)) {
        return std::nullopt;
    }
    return date;
}

std::string format_iso_date(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month,
                  date.day);
    return buffer;
}

std::optional<std::string> normalize_date(const std::string& text) {
    const std::string value = core::text::trim(text);
    if (value.empty() || !only_date_characters(value)) {
        return std::nullopt;
    }

    const auto groups = digit_groups(value);
    CalendarDate date;
    if (groups.size() == 1 && groups[0].size() == 8) {
        date.year = std::stoi(groups[0].substr(0, 4));
        date.month = std::stoi(groups[0].substr(4, 2));
        date.day = std::stoi(groups[0].substr(6, 2));
    } else if (groups.size() == 3 && groups[0].size() == 4 && groups[1].size() <= 2 &&
               groups[2].size() <= 2) {
        date.year = std::stoi(groups[0]);
        date.month = std::stoi(groups[1]);
        date.day = std::stoi(groups[2]);
    } else {
        return std::nullopt;
    }

    if (!is_valid(date)) {
        return std::nullopt;
    }
    return format_iso_date(date);
}

CalendarDate first_day_of_month(const int year, const int month) {
    return CalendarDate{year, month, 1};
}

CalendarDate last_day_of_month(const int year, const int month) {
    return CalendarDate{year, month, days_in_month(year, month)};
}

CalendarDate system_today() {
    const std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

}  // namespace taskpilot::core::time
