/*
 * UTF8Util.h - UTF-8 validation and legacy text decoding
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

#ifndef ICYREC_CORE_UTILITY_UTF8UTIL_H
#define ICYREC_CORE_UTILITY_UTF8UTIL_H

#include <cstdint>
#include <string>

namespace IcyRec {
namespace Core {
namespace Utility {

/**
 * @brief UTF-8 encoding/decoding utilities
 *
 * All text inside IcyRec is represented as UTF-8. Stream servers are not
 * consistent about the encoding of inline metadata, so incoming bytes are
 * validated and, failing that, reinterpreted as ISO-8859-1.
 *
 * Thread Safety: All methods are stateless and thread-safe.
 */
class UTF8Util {
public:
    /**
     * @brief Check if a string is valid UTF-8
     * @param text String to validate
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Check if a byte buffer is valid UTF-8
     * @param data Pointer to data
     * @param size Size of data in bytes
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const uint8_t* data, size_t size);

    /**
     * @brief Convert ISO-8859-1 (Latin-1) bytes to UTF-8
     *
     * Every byte maps to the codepoint of the same value, so this never fails.
     * @param data Pointer to Latin-1 encoded data
     * @param size Size of data in bytes
     * @return UTF-8 encoded string
     */
    static std::string fromLatin1(const uint8_t* data, size_t size);

    /**
     * @brief Decode bytes as UTF-8, falling back to Latin-1 when they are not valid UTF-8
     */
    static std::string decodeWithFallback(const uint8_t* data, size_t size);

    /**
     * @brief Decode a single codepoint from UTF-8 data
     * @param data Pointer to UTF-8 data
     * @param size Available bytes
     * @param bytesConsumed Output: number of bytes consumed
     * @return Decoded codepoint, or U+FFFD on error
     */
    static uint32_t decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed);

    static void appendCodepoint(std::string& output, uint32_t codepoint);
};

} // namespace Utility
} // namespace Core
} // namespace IcyRec

#endif // ICYREC_CORE_UTILITY_UTF8UTIL_H
