/*
 * TrackInfo.cpp - Track change events
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Track {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

} // namespace

TrackInfo TrackInfo::fromMetadata(uint64_t filepos, double timepos, const Icy::Metadata& metadata) {
    TrackInfo info(filepos, timepos, std::string());
    auto title = metadata.find("streamtitle");
    if (title != metadata.end()) {
        info.name = title->second;
    }
    auto url = metadata.find("streamurl");
    if (url != metadata.end()) {
        info.cover = url->second;
    }
    return info;
}

std::string TrackInfo::formatHMS(double seconds) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    }
    uint64_t total = static_cast<uint64_t>(seconds);
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%llu:%02u:%02u",
             static_cast<unsigned long long>(total / 3600),
             static_cast<unsigned>((total / 60) % 60),
             static_cast<unsigned>(total % 60));
    return buffer;
}

std::string TrackInfo::timeposString() const {
    return formatHMS(timepos);
}

TrackInfo::ArtistTitle TrackInfo::artistTitle() const {
    static const std::regex separator(R"(\s+-\s+)");

    ArtistTitle result;
    std::smatch match;
    if (std::regex_search(name, match, separator)) {
        result.has_artist = true;
        result.artist = trim(match.prefix().str());
        result.title = trim(match.suffix().str());
    } else {
        result.title = trim(name);
    }
    return result;
}

} // namespace Track
} // namespace IcyRec
