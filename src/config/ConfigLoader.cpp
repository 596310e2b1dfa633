/*
 * ConfigLoader.cpp - INI-style configuration loader
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Config {

using Core::ConfigException;

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Strip one level of matching quotes
std::string unquote(const std::string& text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

struct PendingStream {
    StreamConfig stream;
    std::optional<bool> cuesheet;
    std::optional<bool> tracklist;
    int line = 0;
};

} // namespace

CutMode parseCutMode(const std::string& text) {
    std::string mode = toLower(trim(text));
    if (mode == "immediate") {
        return CutMode::Immediate;
    }
    if (mode == "on-track" || mode == "defer-to-next-track") {
        return CutMode::OnTrack;
    }
    throw ConfigException("Unknown cut mode '" + text + "' (expected immediate or on-track)");
}

const char* cutModeName(CutMode mode) {
    switch (mode) {
        case CutMode::Immediate: return "immediate";
        case CutMode::OnTrack: return "on-track";
    }
    return "unknown";
}

bool ConfigLoader::parseBool(const std::string& text, bool& value) {
    std::string v = toLower(trim(text));
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        value = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        value = false;
        return true;
    }
    return false;
}

AppConfig ConfigLoader::load(const std::string& path) {
    Debug::log("config", "Reading configuration from ", path);
    std::ifstream config(path);
    if (!config.is_open()) {
        throw ConfigException("Cannot open configuration file '" + path + "': " + strerror(errno));
    }
    return parse(config, path);
}

AppConfig ConfigLoader::parse(std::istream& in, const std::string& origin) {
    AppConfig app;
    std::vector<PendingStream> pending;
    std::string section;
    std::string line;
    int line_no = 0;

    auto fail = [&](const std::string& why) -> ConfigException {
        return ConfigException(origin + ":" + std::to_string(line_no) + ": " + why);
    };
    auto boolValue = [&](const std::string& key, const std::string& value) {
        bool result = false;
        if (!parseBool(value, result)) {
            throw fail("'" + key + "' expects a boolean, got '" + value + "'");
        }
        return result;
    };

    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw fail("Malformed section header '" + line + "'");
            }
            section = toLower(trim(line.substr(1, line.size() - 2)));
            if (section == "stream" || section == "streams") {
                section = "stream";
                PendingStream p;
                p.line = line_no;
                pending.push_back(p);
            } else if (section != "recording") {
                Debug::log("config", origin, ":", line_no, ": ignoring unknown section [", section, "]");
            }
            continue;
        }

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            throw fail("Expected 'key = value', got '" + line + "'");
        }

        std::string key = toLower(trim(line.substr(0, equals)));
        std::string value = unquote(trim(line.substr(equals + 1)));

        if (section == "recording") {
            RecordingConfig& rec = app.recording;
            if (key == "output") {
                rec.output = value;
            } else if (key == "cuesheet") {
                rec.cuesheet = boolValue(key, value);
            } else if (key == "tracklist") {
                rec.tracklist = boolValue(key, value);
            } else if (key == "chapters" || key == "matroska") {
                rec.chapters = boolValue(key, value);
            } else if (key == "start_mode") {
                try {
                    rec.start_mode = parseCutMode(value);
                } catch (const ConfigException& e) {
                    throw fail(e.what());
                }
            } else if (key == "stop_mode") {
                try {
                    rec.stop_mode = parseCutMode(value);
                } catch (const ConfigException& e) {
                    throw fail(e.what());
                }
            } else {
                Debug::log("config", origin, ":", line_no, ": ignoring unknown key '", key, "'");
            }
        } else if (section == "stream") {
            PendingStream& p = pending.back();
            if (key == "name") {
                p.stream.name = value;
            } else if (key == "url") {
                p.stream.url = value;
            } else if (key == "type") {
                p.stream.type = value;
            } else if (key == "cuesheet") {
                p.cuesheet = boolValue(key, value);
            } else if (key == "tracklist") {
                p.tracklist = boolValue(key, value);
            } else {
                Debug::log("config", origin, ":", line_no, ": ignoring unknown key '", key, "'");
            }
        } else {
            Debug::log("config", origin, ":", line_no, ": ignoring '", key, "' outside a known section");
        }
    }

    for (const auto& p : pending) {
        line_no = p.line;
        StreamConfig stream = p.stream;
        if (stream.name.empty()) {
            throw fail("[stream] without a name");
        }
        std::string scheme = toLower(stream.url.substr(0, stream.url.find("://")));
        if (stream.url.find("://") == std::string::npos || (scheme != "http" && scheme != "https")) {
            throw fail("[stream] '" + stream.name + "' needs an http:// or https:// url");
        }
        stream.cuesheet = p.cuesheet.value_or(app.recording.cuesheet);
        stream.tracklist = p.tracklist.value_or(app.recording.tracklist);
        app.streams.push_back(stream);
        Debug::log("config", "Stream '", stream.name, "' -> ", stream.url, " (.", stream.fileExtension(), ")");
    }

    if (app.streams.empty()) {
        throw ConfigException(origin + ": no [stream] configured");
    }

    return app;
}

} // namespace Config
} // namespace IcyRec
