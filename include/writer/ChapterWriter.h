/*
 * ChapterWriter.h - Matroska chapter XML sink
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

#ifndef ICYREC_WRITER_CHAPTERWRITER_H
#define ICYREC_WRITER_CHAPTERWRITER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Writer {

/**
 * @brief Writes Matroska chapter XML (as read by mkvmerge --chapters)
 *
 * The envelope is written on first use, one ChapterAtom per track with
 * ChapterUIDs counting up from 1, and the closing tags on close(). Closing
 * a writer that never saw a track still yields a valid empty document.
 */
class ChapterWriter : public TrackWriter {
public:
    ChapterWriter(std::string path, std::string edition_name, DebugChannel log);
    ~ChapterWriter() override;

    const char* kind() const override { return "chapter file"; }

    // HH:MM:SS.nnnnnnnnn
    static std::string formatChapterTime(double seconds);

    // Artist and title joined by U+2014, or the title alone
    static std::string displayTitle(const Track::TrackInfo& track);

    uint64_t nextChapterUID() const { return m_chapter_uid; }

protected:
    void writeTrack(const Track::TrackInfo& track) override;
    void finalize() override;

private:
    void openDocument();

    std::string m_edition_name;
    bool m_document_open = false;
    uint64_t m_chapter_uid = 1;
};

} // namespace Writer
} // namespace IcyRec

#endif // ICYREC_WRITER_CHAPTERWRITER_H
