/*
 * IcyMetadataParser.cpp - Parser for inline Icy metadata blocks
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Icy {

using Core::Utility::UTF8Util;

static const std::regex s_single_quoted(R"((\w+)='([^']*)')");
static const std::regex s_double_quoted(R"re((\w+)="([^"]*)")re");

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(start, end - start + 1);
}

static size_t collect(const std::string& text, const std::regex& pattern, Metadata& result) {
    size_t found = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it) {
        std::string key = (*it)[1].str();
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        result[trim(key)] = trim((*it)[2].str());
        ++found;
    }
    return found;
}

size_t IcyMetadataParser::stripPadding(const uint8_t* data, size_t size) {
    while (size > 0 && data[size - 1] == 0x00) {
        --size;
    }
    return size;
}

Metadata IcyMetadataParser::parse(const uint8_t* data, size_t size) {
    Metadata result;
    if (!data) {
        return result;
    }

    size_t length = stripPadding(data, size);
    if (length == 0) {
        return result;
    }

    try {
        std::string text = UTF8Util::decodeWithFallback(data, length);
        if (collect(text, s_single_quoted, result) == 0) {
            collect(text, s_double_quoted, result);
        }
    } catch (const std::exception& e) {
        // std::regex can run out of stack on hostile input
        Debug::log("icy", "IcyMetadataParser: discarding unparseable block: ", e.what());
        result.clear();
    }
    return result;
}

Metadata IcyMetadataParser::parse(const std::vector<uint8_t>& block) {
    return parse(block.data(), block.size());
}

Metadata IcyMetadataParser::parse(const std::string& block) {
    return parse(reinterpret_cast<const uint8_t*>(block.data()), block.size());
}

} // namespace Icy
} // namespace IcyRec
