/*
 * IcyStreamReader.cpp - Icy stream framer
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Icy {

double IcyStreamReader::steadySeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

IcyStreamReader::IcyStreamReader(std::unique_ptr<IO::IOHandler> source, size_t metaint,
                                 DebugChannel log, MonotonicClock clock)
    : m_source(std::move(source))
    , m_metaint(metaint)
    , m_log(std::move(log))
    , m_clock(clock ? std::move(clock) : MonotonicClock(&IcyStreamReader::steadySeconds)) {
    if (!m_source) {
        throw std::invalid_argument("IcyStreamReader needs a byte source");
    }
    if (m_metaint == 0 || m_metaint > MAX_META_INTERVAL) {
        throw std::invalid_argument("IcyStreamReader: metadata interval out of range: " + std::to_string(m_metaint));
    }
}

IcyStreamReader::~IcyStreamReader() {
    if (m_source) {
        m_source->close();
    }
}

long IcyStreamReader::parseMetaInterval(const std::string& header) {
    long long value = Core::Utility::TimeUtil::safeInt(header, 0);
    if (value <= 0 || value > static_cast<long long>(MAX_META_INTERVAL)) {
        return 0;
    }
    return static_cast<long>(value);
}

std::unique_ptr<IO::HTTP::HTTPIOHandler> IcyStreamReader::createSource(const Config::StreamConfig& stream) {
    std::map<std::string, std::string> request_headers = {
        {"Icy-MetaData", "1"},
    };
    return std::make_unique<IO::HTTP::HTTPIOHandler>(stream.url, request_headers);
}

size_t IcyStreamReader::negotiate(IO::HTTP::HTTPIOHandler& http, DebugChannel log) {
    http.open();

    long status = http.statusCode();
    if (status < 200 || status >= 300) {
        log.log("Request failed, status: ", status);
        throw Core::ConnectionError("HTTP status " + std::to_string(status) + " from " + http.getUrl(), status);
    }

    std::string header = http.getHeader("icy-metaint");
    long metaint = parseMetaInterval(header);
    if (metaint <= 0) {
        log.log("No embedded metadata (icy-metaint: '", header, "')");
        throw Core::ConnectionError("Stream " + http.getUrl() + " does not provide inline metadata", status);
    }

    log.log("Stream blocksize: ", metaint, " bytes, content type: ", http.getHeader("content-type"));
    return static_cast<size_t>(metaint);
}

void IcyStreamReader::stop() noexcept {
    m_stopped.store(true);
    m_source->abort();
}

bool IcyStreamReader::finish(const char* reason) {
    if (!m_finished) {
        m_finished = true;
        off_t consumed = m_source->tell();
        if (m_stopped.load()) {
            m_log.log("Stream reader stopped after ", m_chunks, " chunks, ", consumed, " bytes");
        } else {
            int error = m_source->getLastError();
            std::string cause = error ? std::string("error: ") + strerror(error)
                              : m_source->eof() ? std::string("end of stream") : std::string("no data");
            m_log.log("Stream ended (", reason, ", ", cause, ") after ", m_chunks, " chunks, ", consumed, " bytes");
        }
    }
    return false;
}

bool IcyStreamReader::readBlock(uint8_t* buffer, size_t length, const char* what) {
    size_t got = 0;
    while (got < length) {
        if (m_stopped.load()) {
            return false;
        }
        size_t n = m_source->read(buffer + got, 1, length - got);
        if (n == 0) {
            DEBUG_LOG("icy", "short read of ", what, ": ", got, "/", length);
            return false;
        }
        got += n;
    }
    return true;
}

bool IcyStreamReader::next(StreamChunk& chunk) {
    if (m_finished) {
        return false;
    }
    if (m_stopped.load()) {
        return finish("stopped");
    }

    double now = m_clock();
    if (!m_started) {
        m_start_time = now;
        m_started = true;
    }

    chunk.timestamp = now - m_start_time;
    chunk.metadata.clear();
    chunk.audio.resize(m_metaint);

    if (!readBlock(chunk.audio.data(), m_metaint, "audio")) {
        chunk.audio.clear();
        return finish("audio");
    }

    uint8_t length_byte = 0;
    if (!readBlock(&length_byte, 1, "metadata length")) {
        chunk.audio.clear();
        return finish("metadata length");
    }

    size_t meta_length = static_cast<size_t>(length_byte) * 16;
    if (meta_length > 0) {
        m_metadata_buffer.resize(meta_length);
        if (!readBlock(m_metadata_buffer.data(), meta_length, "metadata")) {
            chunk.audio.clear();
            return finish("metadata");
        }

        size_t text_length = IcyMetadataParser::stripPadding(m_metadata_buffer.data(), meta_length);
        if (text_length > 0) {
            if (text_length == m_last_metadata.size() &&
                std::equal(m_last_metadata.begin(), m_last_metadata.end(), m_metadata_buffer.begin())) {
                ++m_duplicates;
                DEBUG_LOG("icy", "unchanged metadata block ignored");
            } else {
                m_last_metadata.assign(m_metadata_buffer.begin(), m_metadata_buffer.begin() + text_length);
                chunk.metadata = IcyMetadataParser::parse(m_metadata_buffer.data(), text_length);
            }
        }
    }

    ++m_chunks;
    return true;
}

} // namespace Icy
} // namespace IcyRec
