/*
 * TrackInfo.h - Track change events
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

#ifndef ICYREC_TRACK_TRACKINFO_H
#define ICYREC_TRACK_TRACKINFO_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Track {

/**
 * @brief A track change observed while recording
 *
 * filepos is the number of audio bytes written before the track began,
 * timepos the seconds elapsed since the recording started.
 */
struct TrackInfo {
    uint64_t filepos = 0;
    double timepos = 0.0;
    std::string name;       ///< Raw stream title, usually "Artist - Title"
    std::string cover;      ///< Stream URL from the metadata, may be empty

    struct ArtistTitle {
        bool has_artist = false;
        std::string artist;
        std::string title;
    };

    TrackInfo() = default;
    TrackInfo(uint64_t file_position, double time_position, std::string track_name, std::string cover_url = "")
        : filepos(file_position), timepos(time_position),
          name(std::move(track_name)), cover(std::move(cover_url)) {}

    static TrackInfo fromMetadata(uint64_t filepos, double timepos, const Icy::Metadata& metadata);

    // H:MM:SS, hours not padded
    std::string timeposString() const;

    // Split at the first " - " (any whitespace run around the dash)
    ArtistTitle artistTitle() const;

    static std::string formatHMS(double seconds);
};

} // namespace Track
} // namespace IcyRec

#endif // ICYREC_TRACK_TRACKINFO_H
