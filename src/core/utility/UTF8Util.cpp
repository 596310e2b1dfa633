/*
 * UTF8Util.cpp - UTF-8 validation and legacy text decoding
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

static const std::string REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (codepoint < 0x80) {
        output += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        output += static_cast<char>(0xC0 | (codepoint >> 6));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codepoint >> 12));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        output += static_cast<char>(0xF0 | (codepoint >> 18));
        output += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        output += REPLACEMENT_CHAR;
    }
}

namespace {

const uint32_t REPLACEMENT_CODEPOINT = 0xFFFD;

// Smallest codepoint that needs a sequence of the given length
const uint32_t MIN_CODEPOINT[] = {0, 0, 0x80, 0x800, 0x10000};
// Payload bits of the lead byte
const uint8_t LEAD_MASK[] = {0, 0x7F, 0x1F, 0x0F, 0x07};

// Sequence length announced by a lead byte, 0 if it cannot start one
size_t sequenceLength(uint8_t lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

} // namespace

uint32_t UTF8Util::decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed) {
    if (!data || size == 0) {
        bytesConsumed = 0;
        return REPLACEMENT_CODEPOINT;
    }

    size_t length = sequenceLength(data[0]);
    if (length == 0 || length > size) {
        bytesConsumed = 1;
        return REPLACEMENT_CODEPOINT;
    }

    uint32_t cp = data[0] & LEAD_MASK[length];
    for (size_t i = 1; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            // Resynchronise on the byte that broke the sequence
            bytesConsumed = 1;
            return REPLACEMENT_CODEPOINT;
        }
        cp = (cp << 6) | (data[i] & 0x3F);
    }

    bytesConsumed = length;
    if (cp < MIN_CODEPOINT[length] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return REPLACEMENT_CODEPOINT;
    }
    return cp;
}

bool UTF8Util::isValid(const uint8_t* data, size_t size) {
    if (!data) {
        return size == 0;
    }

    size_t i = 0;
    while (i < size) {
        size_t consumed = 0;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        // An encoded U+FFFD is fine, anything else that decodes to it is not
        if (cp == REPLACEMENT_CODEPOINT &&
            (consumed != 3 || std::memcmp(data + i, REPLACEMENT_CHAR.data(), 3) != 0)) {
            return false;
        }
        i += consumed;
    }
    return true;
}

bool UTF8Util::isValid(const std::string& text) {
    return isValid(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string UTF8Util::fromLatin1(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return "";
    }

    std::string result;
    result.reserve(size * 2); // Worst case: all chars need 2 bytes in UTF-8

    for (size_t i = 0; i < size; ++i) {
        appendCodepoint(result, data[i]);
    }

    return result;
}

std::string UTF8Util::decodeWithFallback(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return "";
    }
    if (isValid(data, size)) {
        return std::string(reinterpret_cast<const char*>(data), size);
    }
    return fromLatin1(data, size);
}

} // namespace Utility
} // namespace Core
} // namespace IcyRec
