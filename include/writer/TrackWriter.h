/*
 * TrackWriter.h - Track event sink interface
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

#ifndef ICYREC_WRITER_TRACKWRITER_H
#define ICYREC_WRITER_TRACKWRITER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Writer {

/**
 * @brief Base class for the side artifacts written next to a recording
 *
 * addTrack() and close() never throw. A failure is logged the first time
 * and only counted afterwards, so a full disk produces one log line instead
 * of one per track, and the audio path and the other sinks carry on.
 *
 * Subclasses implement writeTrack() and, when the document needs a
 * trailer, finalize(). Both report failures by throwing; emit() does that
 * for a short write.
 */
class TrackWriter {
public:
    // open_mode is the fopen() mode used on first write, "a" or "w"
    TrackWriter(std::string path, DebugChannel log, const char* open_mode = "a");
    virtual ~TrackWriter();

    TrackWriter(const TrackWriter&) = delete;
    TrackWriter& operator=(const TrackWriter&) = delete;

    void addTrack(const Track::TrackInfo& track) noexcept;

    // Flush and finalize. Idempotent.
    void close() noexcept;

    // Delete the artifact if it exists. Used when a recording captured nothing.
    bool remove() noexcept;

    const std::string& path() const { return m_path; }
    unsigned failureCount() const { return m_failures; }
    bool isClosed() const { return m_closed; }

    virtual const char* kind() const = 0;

protected:
    virtual void writeTrack(const Track::TrackInfo& track) = 0;
    virtual void finalize() {}

    // Appends text to the artifact, opening it on first use
    void emit(const std::string& text);
    void flush();

    DebugChannel m_log;

private:
    void openFile();
    void reportFailure(const char* operation, const std::exception& e) noexcept;

    std::string m_path;
    const char* m_open_mode;
    IO::RAIIFileHandle m_file;
    unsigned m_failures = 0;
    bool m_closed = false;
};

} // namespace Writer
} // namespace IcyRec

#endif // ICYREC_WRITER_TRACKWRITER_H
