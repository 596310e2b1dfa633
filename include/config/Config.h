/*
 * Config.h - Recording and stream configuration
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

#ifndef ICYREC_CONFIG_CONFIG_H
#define ICYREC_CONFIG_CONFIG_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Config {

/**
 * @brief Where a recording starts or stops relative to track boundaries
 */
enum class CutMode {
    Immediate,  ///< At the wall-clock instant
    OnTrack     ///< At the next metadata change
};

// Accepts "immediate", "on-track" and "defer-to-next-track" (case-insensitive).
CutMode parseCutMode(const std::string& text);
const char* cutModeName(CutMode mode);

inline std::ostream& operator<<(std::ostream& os, CutMode mode) {
    return os << cutModeName(mode);
}

/**
 * @brief One stream to record, fully resolved
 */
struct StreamConfig {
    std::string name;        ///< Display name, used for file names and sink headers
    std::string url;         ///< http:// or https:// stream URL
    std::string type;        ///< Declared content type, used as the audio file extension
    bool cuesheet = false;   ///< Write a .cue file
    bool tracklist = true;   ///< Write a .txt track list

    // Extension for the audio file, "dat" if no type was declared
    std::string fileExtension() const { return type.empty() ? std::string("dat") : type; }
};

/**
 * @brief Session-wide recording defaults
 */
struct RecordingConfig {
    std::string output = "./recordings";
    bool cuesheet = false;
    bool tracklist = true;
    bool chapters = true;
    CutMode start_mode = CutMode::Immediate;
    CutMode stop_mode = CutMode::Immediate;
};

struct AppConfig {
    RecordingConfig recording;
    std::vector<StreamConfig> streams;
};

/**
 * @brief Loader for the INI-style configuration file
 *
 *   # comment
 *   [recording]
 *   output = ./recordings
 *   stop_mode = on-track
 *
 *   [stream]
 *   name = Radio Paradise
 *   url = http://stream.radioparadise.com/mp3-192
 *   type = mp3
 *
 * [stream] may be repeated. cuesheet/tracklist given in a stream section
 * override the [recording] defaults for that stream only.
 */
class ConfigLoader {
public:
    /**
     * @throws Core::ConfigException if the file cannot be read or is invalid
     */
    static AppConfig load(const std::string& path);

    /**
     * @param origin Name used in error messages
     * @throws Core::ConfigException on invalid content
     */
    static AppConfig parse(std::istream& in, const std::string& origin = "<config>");

    /**
     * @brief Parse true/false/yes/no/on/off/1/0
     * @return false if the text is not a boolean
     */
    static bool parseBool(const std::string& text, bool& value);
};

} // namespace Config
} // namespace IcyRec

#endif // ICYREC_CONFIG_CONFIG_H
