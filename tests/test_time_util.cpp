/*
 * test_time_util.cpp - Date/time argument and integer parsing tests
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"
#include "test_framework.h"

using IcyRec::Core::ArgumentException;
using IcyRec::Core::Utility::TimeUtil;
using namespace TestFramework;

namespace {

std::tm makeToday() {
    std::tm today{};
    today.tm_year = 2024 - 1900;
    today.tm_mon = 1;    // February
    today.tm_mday = 29;
    return today;
}

void assertTm(const std::tm& tm, int year, int month, int day, int hour, int minute, int second,
              const std::string& message) {
    ASSERT_EQUALS(year, tm.tm_year + 1900, message + " (year)");
    ASSERT_EQUALS(month, tm.tm_mon + 1, message + " (month)");
    ASSERT_EQUALS(day, tm.tm_mday, message + " (day)");
    ASSERT_EQUALS(hour, tm.tm_hour, message + " (hour)");
    ASSERT_EQUALS(minute, tm.tm_min, message + " (minute)");
    ASSERT_EQUALS(second, tm.tm_sec, message + " (second)");
}

void assertInvalid(const std::string& text) {
    TestPatterns::assertThrows<ArgumentException>([&]() { TimeUtil::parseDateTimeArg(text, makeToday()); },
                                                  "is not valid", "Accepted '" + text + "'");
}

} // namespace

class FullDateTimeTest : public TestCase {
public:
    FullDateTimeTest() : TestCase("Full date and time") {}

protected:
    void runTest() override {
        std::tm today = makeToday();
        assertTm(TimeUtil::parseDateTimeArg("2025-09-01 18:30", today), 2025, 9, 1, 18, 30, 0, "No seconds");
        assertTm(TimeUtil::parseDateTimeArg("2025-09-01 18:30:15", today), 2025, 9, 1, 18, 30, 15, "Seconds");
        assertTm(TimeUtil::parseDateTimeArg("2025-09-01T7:05:09", today), 2025, 9, 1, 7, 5, 9, "T separator");
        assertTm(TimeUtil::parseDateTimeArg("  2025-12-31   23:59:59 ", today), 2025, 12, 31, 23, 59, 59, "Blanks");
        assertTm(TimeUtil::parseDateTimeArg("2000-02-29 00:00", today), 2000, 2, 29, 0, 0, 0, "Leap day");

        std::tm parsed = TimeUtil::parseDateTimeArg("2025-09-01 18:30", today);
        ASSERT_EQUALS(-1, parsed.tm_isdst, "DST left to mktime");
    }
};

class TimeOnlyTest : public TestCase {
public:
    TimeOnlyTest() : TestCase("Time of day refers to today") {}

protected:
    void runTest() override {
        std::tm today = makeToday();
        assertTm(TimeUtil::parseDateTimeArg("9:15", today), 2024, 2, 29, 9, 15, 0, "Short form");
        assertTm(TimeUtil::parseDateTimeArg("23:00:45", today), 2024, 2, 29, 23, 0, 45, "With seconds");
    }
};

class InvalidDateTimeTest : public TestCase {
public:
    InvalidDateTimeTest() : TestCase("Malformed and out-of-range values") {}

protected:
    void runTest() override {
        assertInvalid("");
        assertInvalid("tomorrow");
        assertInvalid("18h30");
        assertInvalid("2025-9-01 18:30");
        assertInvalid("2025-09-01");
        assertInvalid("24:00");
        assertInvalid("12:60");
        assertInvalid("12:00:60");
        assertInvalid("2025-13-01 00:00");
        assertInvalid("2025-00-10 00:00");
        assertInvalid("2025-02-29 00:00");
        assertInvalid("1900-02-29 00:00");
        assertInvalid("2025-04-31 00:00");

        TestPatterns::assertThrows<ArgumentException>([]() {
            TimeUtil::parseDateTimeArg("2025-04-31 00:00", makeToday());
        }, "day out of range", "Reason included");
    }
};

class LocalRoundTripTest : public TestCase {
public:
    LocalRoundTripTest() : TestCase("Local time conversion and formatting") {}

protected:
    void runTest() override {
        auto when = TimeUtil::toTimePoint(TimeUtil::parseDateTimeArg("2025-09-01 12:34:56", makeToday()));
        ASSERT_EQUALS(std::string("20250901-123456"), TimeUtil::formatLocal(when, "%Y%m%d-%H%M%S"), "Formatted");

        auto later = TimeUtil::toTimePoint(TimeUtil::parseDateTimeArg("2025-09-01 12:35:06", makeToday()));
        ASSERT_TRUE(later - when == std::chrono::seconds(10), "Ten seconds apart");
    }
};

class CalendarTest : public TestCase {
public:
    CalendarTest() : TestCase("Leap years and month lengths") {}

protected:
    void runTest() override {
        ASSERT_TRUE(TimeUtil::isLeapYear(2024), "2024");
        ASSERT_TRUE(TimeUtil::isLeapYear(2000), "2000");
        ASSERT_FALSE(TimeUtil::isLeapYear(1900), "1900");
        ASSERT_FALSE(TimeUtil::isLeapYear(2025), "2025");

        ASSERT_EQUALS(29, TimeUtil::daysInMonth(2024, 2), "Leap February");
        ASSERT_EQUALS(28, TimeUtil::daysInMonth(2025, 2), "February");
        ASSERT_EQUALS(30, TimeUtil::daysInMonth(2025, 11), "November");
        ASSERT_EQUALS(0, TimeUtil::daysInMonth(2025, 13), "No such month");
    }
};

class SafeIntTest : public TestCase {
public:
    SafeIntTest() : TestCase("Lenient integer parsing") {}

protected:
    void runTest() override {
        ASSERT_EQUALS(42LL, TimeUtil::safeInt("42"), "Plain");
        ASSERT_EQUALS(16000LL, TimeUtil::safeInt(" 16000\r\n"), "Header value with CRLF");
        ASSERT_EQUALS(-7LL, TimeUtil::safeInt("-7"), "Negative");
        ASSERT_EQUALS(7LL, TimeUtil::safeInt("+007"), "Sign and leading zeros");
        ASSERT_EQUALS(1000000LL, TimeUtil::safeInt("1_000_000"), "Underscores between digits");

        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("", -1), "Empty");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("   ", -1), "Blank");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("12a", -1), "Trailing garbage");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("1__0", -1), "Double underscore");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("_1", -1), "Leading underscore");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("1_", -1), "Trailing underscore");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("-", -1), "Sign only");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("1.5", -1), "Fraction");

        ASSERT_EQUALS(std::numeric_limits<long long>::max(), TimeUtil::safeInt("9223372036854775807"), "Max");
        ASSERT_EQUALS(std::numeric_limits<long long>::min(), TimeUtil::safeInt("-9223372036854775808"), "Min");
        ASSERT_EQUALS(-1LL, TimeUtil::safeInt("9223372036854775808", -1), "Overflow");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("TimeUtil Tests");

    suite.addTest(std::make_unique<FullDateTimeTest>());
    suite.addTest(std::make_unique<TimeOnlyTest>());
    suite.addTest(std::make_unique<InvalidDateTimeTest>());
    suite.addTest(std::make_unique<LocalRoundTripTest>());
    suite.addTest(std::make_unique<CalendarTest>());
    suite.addTest(std::make_unique<SafeIntTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
