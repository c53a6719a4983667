#include "pyupdater/calendar.hpp"

#include <charconv>
#include <ctime>
#include <tuple>

#include <fmt/format.h>

namespace pyupdater {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Decimal digits only, between min_width and max_width of them.
std::optional<int> parseNumber(std::string_view text, std::size_t min_width, std::size_t max_width) {
    if (text.size() < min_width || text.size() > max_width) {
        return std::nullopt;
    }
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Date Date::nextDay() const {
    Date next = *this;
    if (++next.day > daysInMonth(next.year, next.month)) {
        next.day = 1;
        if (++next.month > 12) {
            next.month = 1;
            ++next.year;
        }
    }
    return next;
}

std::string Date::toIsoString() const {
    return fmt::format("{:04}-{:02}-{:02}", year, month, day);
}

std::optional<Date> Date::parseIso(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto year = parseNumber(text.substr(0, 4), 4, 4);
    const auto month = parseNumber(text.substr(5, 2), 2, 2);
    const auto day = parseNumber(text.substr(8, 2), 2, 2);
    if (!year || !month || !day || *month < 1 || *month > 12) {
        return std::nullopt;
    }
    if (*day < 1 || *day > daysInMonth(*year, *month)) {
        return std::nullopt;
    }
    return Date{*year, *month, *day};
}

bool operator==(const Date& lhs, const Date& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) == std::tie(rhs.year, rhs.month, rhs.day);
}

bool operator!=(const Date& lhs, const Date& rhs) { return !(lhs == rhs); }

bool operator<(const Date& lhs, const Date& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

std::string TimeOfDay::toString() const {
    return fmt::format("{:02}:{:02}", hour, minute);
}

std::optional<TimeOfDay> TimeOfDay::parse(std::string_view text) {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    const auto hour = parseNumber(text.substr(0, colon), 1, 2);
    const auto minute = parseNumber(text.substr(colon + 1), 2, 2);
    if (!hour || !minute || *hour > 23 || *minute > 59) {
        return std::nullopt;
    }
    return TimeOfDay{*hour, *minute, 0};
}

bool operator==(const TimeOfDay& lhs, const TimeOfDay& rhs) {
    return lhs.secondsSinceMidnight() == rhs.secondsSinceMidnight();
}

bool operator<(const TimeOfDay& lhs, const TimeOfDay& rhs) {
    return lhs.secondsSinceMidnight() < rhs.secondsSinceMidnight();
}

std::string LocalDateTime::toString() const {
    return date.toIsoString() + " " + time.toString();
}

LocalDateTime LocalDateTime::now() {
    const std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    return {{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday},
            {local.tm_hour, local.tm_min, local.tm_sec}};
}

bool operator==(const LocalDateTime& lhs, const LocalDateTime& rhs) {
    return lhs.date == rhs.date && lhs.time == rhs.time;
}

bool operator<(const LocalDateTime& lhs, const LocalDateTime& rhs) {
    if (lhs.date != rhs.date) {
        return lhs.date < rhs.date;
    }
    return lhs.time < rhs.time;
}

} // namespace pyupdater
