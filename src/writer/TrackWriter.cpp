/*
 * TrackWriter.cpp - Track event sink interface
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Writer {

TrackWriter::TrackWriter(std::string path, DebugChannel log, const char* open_mode)
    : m_log(std::move(log)), m_path(std::move(path)), m_open_mode(open_mode) {
}

TrackWriter::~TrackWriter() = default;

void TrackWriter::openFile() {
    if (m_file.is_valid()) {
        return;
    }
    if (!m_file.open(m_path, m_open_mode)) {
        throw std::runtime_error("cannot open: " + std::string(strerror(errno)));
    }
}

void TrackWriter::emit(const std::string& text) {
    openFile();
    if (!m_file.write(text)) {
        throw std::runtime_error("write failed: " + std::string(strerror(errno)));
    }
}

void TrackWriter::flush() {
    if (m_file.is_valid() && !m_file.flush()) {
        throw std::runtime_error("flush failed: " + std::string(strerror(errno)));
    }
}

void TrackWriter::reportFailure(const char* operation, const std::exception& e) noexcept {
    if (m_failures == 0) {
        m_log.log("Writing ", kind(), " to '", m_path, "' failed (", operation, "): ", e.what());
    }
    ++m_failures;
}

void TrackWriter::addTrack(const Track::TrackInfo& track) noexcept {
    if (m_closed) {
        DEBUG_LOG("writer", kind(), " already closed, dropping '", track.name, "'");
        return;
    }
    try {
        writeTrack(track);
        flush();
    } catch (const std::exception& e) {
        reportFailure("add track", e);
    }
}

void TrackWriter::close() noexcept {
    if (m_closed) {
        return;
    }
    m_closed = true;
    try {
        finalize();
        flush();
    } catch (const std::exception& e) {
        reportFailure("close", e);
    }
    if (m_file.is_valid() && m_file.close() != 0) {
        std::runtime_error error("close failed: " + std::string(strerror(errno)));
        reportFailure("close", error);
    }
    if (m_failures > 1) {
        m_log.log(kind(), " '", m_path, "': ", m_failures, " write failures in total");
    }
}

bool TrackWriter::remove() noexcept {
    if (m_file.is_valid()) {
        m_file.close();
    }
    std::error_code ec;
    bool removed = std::filesystem::remove(m_path, ec);
    if (ec) {
        m_log.log("Removing ", kind(), " '", m_path, "' failed: ", ec.message());
        return false;
    }
    if (removed) {
        DEBUG_LOG("writer", "removed ", m_path);
    }
    return removed;
}

} // namespace Writer
} // namespace IcyRec
