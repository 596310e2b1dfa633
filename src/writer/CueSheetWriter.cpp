/*
 * CueSheetWriter.cpp - CD cue sheet sink
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Writer {

CueSheetWriter::CueSheetWriter(std::string performer, std::string audio_filename,
                               std::string path, DebugChannel log)
    : TrackWriter(std::move(path), std::move(log))
    , m_performer(std::move(performer))
    , m_audio_filename(std::move(audio_filename)) {
}

std::string CueSheetWriter::formatCueTime(double seconds) {
    uint64_t frames = seconds > 0.0 ? static_cast<uint64_t>(seconds * FRAMES_PER_SECOND) : 0;
    uint64_t minutes = frames / (FRAMES_PER_SECOND * 60);
    uint64_t secs = (frames / FRAMES_PER_SECOND) % 60;
    uint64_t ff = frames % FRAMES_PER_SECOND;

    char buffer[48];
    snprintf(buffer, sizeof(buffer), "%02llu:%02llu:%02llu",
             static_cast<unsigned long long>(minutes),
             static_cast<unsigned long long>(secs),
             static_cast<unsigned long long>(ff));
    return buffer;
}

std::string CueSheetWriter::header() const {
    std::ostringstream out;
    out << "PERFORMER \"" << m_performer << "\"\n"
        << "FILE \"" << m_audio_filename << "\" WAVE\n";
    return out.str();
}

std::string CueSheetWriter::entry(const Track::TrackInfo& track) {
    std::ostringstream out;

    bool wrapped = false;
    if (m_track_no > MAX_TRACKS) {
        m_track_no = 1;
        wrapped = true;
    }
    if (m_track_no == 1) {
        if (wrapped) {
            out << "\n";
        }
        out << header();
    }

    Track::TrackInfo::ArtistTitle split = track.artistTitle();

    char number[8];
    snprintf(number, sizeof(number), "%02u", m_track_no);

    out << "  TRACK " << number << " AUDIO\n"
        << "    TITLE \"" << split.title << "\"\n"
        << "    PERFORMER \"" << split.artist << "\"\n"
        << "    INDEX 01 " << formatCueTime(track.timepos) << "\n"
        << "    REM FILEPOS " << track.filepos << "\n"
        << "    REM COVER \"" << track.cover << "\"\n";

    ++m_track_no;
    return out.str();
}

void CueSheetWriter::writeTrack(const Track::TrackInfo& track) {
    // The number is consumed even if the write fails
    emit(entry(track));
}

} // namespace Writer
} // namespace IcyRec
