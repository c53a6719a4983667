#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pyupdater {

struct Date {
    int year{1970};
    int month{1};
    int day{1};

    [[nodiscard]] Date nextDay() const;
    [[nodiscard]] std::string toIsoString() const;
    // Accepts YYYY-MM-DD only.
    [[nodiscard]] static std::optional<Date> parseIso(std::string_view text);
};

bool operator==(const Date& lhs, const Date& rhs);
bool operator!=(const Date& lhs, const Date& rhs);
bool operator<(const Date& lhs, const Date& rhs);

struct TimeOfDay {
    int hour{0};
    int minute{0};
    int second{0};

    [[nodiscard]] int minutesSinceMidnight() const { return hour * 60 + minute; }
    [[nodiscard]] int secondsSinceMidnight() const { return minutesSinceMidnight() * 60 + second; }
    // HH:MM
    [[nodiscard]] std::string toString() const;
    // HH:MM with 0 <= HH < 24 and 0 <= MM < 60; one-digit hours are accepted.
    [[nodiscard]] static std::optional<TimeOfDay> parse(std::string_view text);
};

bool operator==(const TimeOfDay& lhs, const TimeOfDay& rhs);
bool operator<(const TimeOfDay& lhs, const TimeOfDay& rhs);

// Wall-clock instant in the local time zone.
struct LocalDateTime {
    Date date;
    TimeOfDay time;

    // YYYY-MM-DD HH:MM
    [[nodiscard]] std::string toString() const;
    [[nodiscard]] static LocalDateTime now();
};

bool operator==(const LocalDateTime& lhs, const LocalDateTime& rhs);
bool operator<(const LocalDateTime& lhs, const LocalDateTime& rhs);

} // namespace pyupdater
