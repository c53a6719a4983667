#include "pyupdater/calendar.hpp"

#include <gtest/gtest.h>

namespace pyupdater {
namespace {

TEST(TimeOfDayTest, ParsesHoursAndMinutes) {
    EXPECT_EQ(TimeOfDay::parse("09:00"), (TimeOfDay{9, 0}));
    EXPECT_EQ(TimeOfDay::parse("7:05"), (TimeOfDay{7, 5}));
    EXPECT_EQ(TimeOfDay::parse("23:59"), (TimeOfDay{23, 59}));
    EXPECT_EQ((TimeOfDay{18, 5}.toString()), "18:05");
}

TEST(TimeOfDayTest, RejectsMalformedText) {
    for (const char* text : {"", "9", "24:00", "12:60", "12:5", "-1:30", "12:-5", "ab:cd", "12:30:00", " 9:00"}) {
        EXPECT_FALSE(TimeOfDay::parse(text).has_value()) << text;
    }
}

TEST(DateTest, IsoRoundTrip) {
    const auto date = Date::parseIso("2024-02-29");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(*date, (Date{2024, 2, 29}));
    EXPECT_EQ(date->toIsoString(), "2024-02-29");
}

TEST(DateTest, RejectsInvalidDates) {
    for (const char* text : {"", "2024-2-29", "2023-02-29", "2024-13-01", "2024-00-10", "2024-04-31", "24-01-01x"}) {
        EXPECT_FALSE(Date::parseIso(text).has_value()) << text;
    }
}

TEST(DateTest, NextDayHandlesMonthAndLeapYears) {
    EXPECT_EQ((Date{2024, 2, 28}).nextDay(), (Date{2024, 2, 29}));
    EXPECT_EQ((Date{2023, 2, 28}).nextDay(), (Date{2023, 3, 1}));
    EXPECT_EQ((Date{1900, 2, 28}).nextDay(), (Date{1900, 3, 1}));
    EXPECT_EQ((Date{2000, 2, 28}).nextDay(), (Date{2000, 2, 29}));
    EXPECT_EQ((Date{2024, 4, 30}).nextDay(), (Date{2024, 5, 1}));
    EXPECT_EQ((Date{2024, 12, 31}).nextDay(), (Date{2025, 1, 1}));
}

TEST(LocalDateTimeTest, OrdersByDateThenTime) {
    const LocalDateTime morning{{2024, 5, 14}, {8, 0, 0}};
    const LocalDateTime later{{2024, 5, 14}, {8, 0, 1}};
    const LocalDateTime next_day{{2024, 5, 15}, {0, 0, 0}};

    EXPECT_TRUE(morning < later);
    EXPECT_TRUE(later < next_day);
    EXPECT_FALSE(next_day < morning);
    EXPECT_EQ(morning.toString(), "2024-05-14 08:00");
}

} // namespace
} // namespace pyupdater
