/*
 * TimeUtil.cpp - Date/time and integer argument helpers
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Core {
namespace Utility {

static const std::regex s_datetime_pattern(
    R"(^\s*(\d{4})-(\d{2})-(\d{2})(?:\s+|[tT])(\d{1,2}):(\d{1,2})(?::(\d{1,2}))?\s*$)");
static const std::regex s_time_pattern(
    R"(^\s*(\d{1,2}):(\d{1,2})(?::(\d{1,2}))?\s*$)");

bool TimeUtil::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int TimeUtil::daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

std::tm TimeUtil::makeTm(int year, int month, int day, int hour, int minute, int second) {
    if (month < 1 || month > 12) {
        throw ArgumentException("month out of range: " + std::to_string(month));
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        throw ArgumentException("day out of range: " + std::to_string(day));
    }
    if (hour > 23) {
        throw ArgumentException("hour out of range: " + std::to_string(hour));
    }
    if (minute > 59) {
        throw ArgumentException("minute out of range: " + std::to_string(minute));
    }
    if (second > 59) {
        throw ArgumentException("second out of range: " + std::to_string(second));
    }

    std::tm result{};
    result.tm_year = year - 1900;
    result.tm_mon = month - 1;
    result.tm_mday = day;
    result.tm_hour = hour;
    result.tm_min = minute;
    result.tm_sec = second;
    result.tm_isdst = -1;
    return result;
}

std::tm TimeUtil::parseDateTimeArg(const std::string& text, const std::tm& today) {
    static const std::string expected = "Expected format: [YYYY-MM-DD] HH:MM[:SS]";
    std::smatch m;

    try {
        if (std::regex_match(text, m, s_datetime_pattern)) {
            return makeTm(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]),
                          std::stoi(m[4]), std::stoi(m[5]),
                          m[6].matched ? std::stoi(m[6]) : 0);
        }
        if (std::regex_match(text, m, s_time_pattern)) {
            return makeTm(today.tm_year + 1900, today.tm_mon + 1, today.tm_mday,
                          std::stoi(m[1]), std::stoi(m[2]),
                          m[3].matched ? std::stoi(m[3]) : 0);
        }
    } catch (const ArgumentException& e) {
        throw ArgumentException("Given date/time '" + text + "' is not valid (" + e.what() + "). " + expected);
    }
    throw ArgumentException("Given date/time '" + text + "' is not valid. " + expected);
}

std::tm TimeUtil::parseDateTimeArg(const std::string& text) {
    std::time_t now = std::time(nullptr);
    std::tm today{};
    localtime_r(&now, &today);
    return parseDateTimeArg(text, today);
}

TimeUtil::Clock::time_point TimeUtil::toTimePoint(std::tm local) {
    local.tm_isdst = -1;
    std::time_t t = std::mktime(&local);
    if (t == static_cast<std::time_t>(-1)) {
        throw ArgumentException("date/time cannot be represented");
    }
    return Clock::from_time_t(t);
}

std::string TimeUtil::formatLocal(Clock::time_point when, const char* format) {
    std::time_t t = Clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream out;
    out << std::put_time(&local, format);
    return out.str();
}

long long TimeUtil::safeInt(const std::string& text, long long default_value) {
    size_t begin = text.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) {
        return default_value;
    }
    size_t end = text.find_last_not_of(" \t\r\n\f\v");

    size_t pos = begin;
    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = (text[pos] == '-');
        pos++;
    }

    std::string digits;
    bool last_was_digit = false;
    for (; pos <= end; ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
            last_was_digit = true;
        } else if (c == '_' && last_was_digit && pos < end &&
                   std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
            last_was_digit = false;
        } else {
            return default_value;
        }
    }
    if (digits.empty()) {
        return default_value;
    }

    unsigned long long limit = negative
        ? static_cast<unsigned long long>(std::numeric_limits<long long>::max()) + 1
        : static_cast<unsigned long long>(std::numeric_limits<long long>::max());
    unsigned long long value = 0;
    for (char c : digits) {
        unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (limit - digit) / 10) {
            return default_value;
        }
        value = value * 10 + digit;
    }

    if (negative) {
        return value == limit ? std::numeric_limits<long long>::min() : -static_cast<long long>(value);
    }
    return static_cast<long long>(value);
}

} // namespace Utility
} // namespace Core
} // namespace IcyRec
