/*
 * TrackListWriter.h - Plain text track list sink
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

#ifndef ICYREC_WRITER_TRACKLISTWRITER_H
#define ICYREC_WRITER_TRACKLISTWRITER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Writer {

// One "H:MM:SS -- title" line per track
class TrackListWriter : public TrackWriter {
public:
    TrackListWriter(std::string path, DebugChannel log);

    const char* kind() const override { return "track list"; }

protected:
    void writeTrack(const Track::TrackInfo& track) override;
};

} // namespace Writer
} // namespace IcyRec

#endif // ICYREC_WRITER_TRACKLISTWRITER_H
