/*
 * CueSheetWriter.h - CD cue sheet sink
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

#ifndef ICYREC_WRITER_CUESHEETWRITER_H
#define ICYREC_WRITER_CUESHEETWRITER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Writer {

/**
 * @brief Writes a cue sheet indexing the tracks of a recording
 *
 * One PERFORMER/FILE header precedes track 01. Cue sheets cannot number
 * past 99, so the 100th track starts over at 01 after a blank line and a
 * repeated header. Entries are appended as they arrive.
 */
class CueSheetWriter : public TrackWriter {
public:
    static const unsigned MAX_TRACKS = 99;
    static const unsigned FRAMES_PER_SECOND = 75;

    CueSheetWriter(std::string performer, std::string audio_filename,
                   std::string path, DebugChannel log);

    const char* kind() const override { return "cue sheet"; }

    // MM:SS:FF in CD frames, truncated to whole frames. Minutes may exceed 99.
    static std::string formatCueTime(double seconds);

    unsigned nextTrackNumber() const { return m_track_no; }

protected:
    void writeTrack(const Track::TrackInfo& track) override;

private:
    std::string header() const;
    std::string entry(const Track::TrackInfo& track);

    std::string m_performer;
    std::string m_audio_filename;
    unsigned m_track_no = 1;
};

} // namespace Writer
} // namespace IcyRec

#endif // ICYREC_WRITER_CUESHEETWRITER_H
