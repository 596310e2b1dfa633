/*
 * TimeUtil.h - Date/time and integer argument helpers
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef ICYREC_CORE_UTILITY_TIMEUTIL_H
#define ICYREC_CORE_UTILITY_TIMEUTIL_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Core {
namespace Utility {

class TimeUtil {
public:
    using Clock = std::chrono::system_clock;

    /**
     * @brief Parse a command line date/time
     *
     * Accepts "YYYY-MM-DD HH:MM[:SS]" (a 'T' may replace the blank) or
     * "HH:MM[:SS]", which refers to the calendar day of @p today. Leading
     * and trailing blanks are ignored, single-digit hour, minute and second
     * are allowed. Every field is range checked.
     *
     * @param text User input
     * @param today Local calendar day used when no date is given
     * @return Broken-down local time (tm_isdst = -1)
     * @throws ArgumentException if the text is not a valid date/time
     */
    static std::tm parseDateTimeArg(const std::string& text, const std::tm& today);

    // Same, relative to the current local day.
    static std::tm parseDateTimeArg(const std::string& text);

    /**
     * @brief Convert broken-down local time to a clock instant
     */
    static Clock::time_point toTimePoint(std::tm local);

    /**
     * @brief Format an instant as local time with strftime()
     */
    static std::string formatLocal(Clock::time_point when, const char* format);

    /**
     * @brief Lenient integer parsing
     *
     * Surrounding whitespace, a sign, leading zeros and single underscores
     * between digits are accepted ("1_000" is 1000). Anything else,
     * including overflow, yields @p default_value.
     */
    static long long safeInt(const std::string& text, long long default_value = 0);

    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);

private:
    static std::tm makeTm(int year, int month, int day, int hour, int minute, int second);
};

} // namespace Utility
} // namespace Core
} // namespace IcyRec

#endif // ICYREC_CORE_UTILITY_TIMEUTIL_H
