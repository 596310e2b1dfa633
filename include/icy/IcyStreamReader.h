/*
 * IcyStreamReader.h - Icy stream framer
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

#ifndef ICYREC_ICY_ICYSTREAMREADER_H
#define ICYREC_ICY_ICYSTREAMREADER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Icy {

/**
 * @brief One framing cycle of an Icy stream
 */
struct StreamChunk {
    double timestamp = 0.0;         ///< Seconds since the read loop began (monotonic)
    std::vector<uint8_t> audio;     ///< Exactly metaint bytes
    Metadata metadata;              ///< Empty when no new metadata came with this chunk
};

/**
 * @brief Splits an Icy byte stream into audio blocks and metadata events
 *
 * The wire format repeats: metaint audio bytes, one length byte L, then
 * L * 16 bytes of metadata text. Each cycle becomes one StreamChunk. The
 * sequence is pulled with next() and is not restartable; it ends on a
 * short read (server closed, network error, read timeout) or after stop().
 *
 * A metadata block byte-identical to the previous one is reported as "no
 * metadata" so an unchanged title never looks like a track change.
 */
class IcyStreamReader {
public:
    using MonotonicClock = std::function<double()>;

    /**
     * @param source Byte source positioned at the first audio byte
     * @param metaint Negotiated metadata interval, must be > 0
     * @param log Logger for this stream
     * @param clock Monotonic clock in seconds, steady_clock when empty
     */
    IcyStreamReader(std::unique_ptr<IO::IOHandler> source, size_t metaint,
                    DebugChannel log = DebugChannel("icy"), MonotonicClock clock = nullptr);
    ~IcyStreamReader();

    IcyStreamReader(const IcyStreamReader&) = delete;
    IcyStreamReader& operator=(const IcyStreamReader&) = delete;

    // Unconnected HTTP source for the stream, asking for inline metadata
    static std::unique_ptr<IO::HTTP::HTTPIOHandler> createSource(const Config::StreamConfig& stream);

    /**
     * @brief Send the request and negotiate the metadata interval
     *
     * The caller keeps ownership of http, so another thread may abort() it
     * while this waits for the response headers.
     * @return The icy-metaint value
     * @throws Core::ConnectionError on transport failure, abort, a non-2xx
     *         status or a missing, malformed or non-positive icy-metaint header
     */
    static size_t negotiate(IO::HTTP::HTTPIOHandler& http, DebugChannel log);

    /**
     * @brief Value of an icy-metaint header, 0 if absent or malformed
     */
    static long parseMetaInterval(const std::string& header);

    /**
     * @brief Produce the next chunk
     * @return false once the sequence has ended; chunk is then unspecified
     */
    bool next(StreamChunk& chunk);

    /**
     * @brief End the sequence
     *
     * Idempotent and async-signal-safe: only flips atomics. A blocked read
     * returns within one poll slice and the next call to next() returns false.
     */
    void stop() noexcept;

    bool isStopped() const noexcept { return m_stopped.load(); }
    uint64_t chunksRead() const { return m_chunks; }
    uint64_t duplicateBlocks() const { return m_duplicates; }

    static double steadySeconds();

private:
    bool readBlock(uint8_t* buffer, size_t length, const char* what);
    bool finish(const char* reason);

    static const size_t MAX_META_INTERVAL = 16 * 1024 * 1024;

    std::unique_ptr<IO::IOHandler> m_source;
    size_t m_metaint;
    DebugChannel m_log;
    MonotonicClock m_clock;

    std::atomic<bool> m_stopped{false};
    bool m_started = false;
    bool m_finished = false;
    double m_start_time = 0.0;

    std::vector<uint8_t> m_metadata_buffer;
    std::vector<uint8_t> m_last_metadata;
    uint64_t m_chunks = 0;
    uint64_t m_duplicates = 0;
};

} // namespace Icy
} // namespace IcyRec

#endif // ICYREC_ICY_ICYSTREAMREADER_H
