/*
 * ChapterWriter.cpp - Matroska chapter XML sink
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

using IcyRec::Core::Utility::XMLUtil;

namespace IcyRec {
namespace Writer {

namespace {
const char* const EM_DASH = "\xE2\x80\x94";
}

ChapterWriter::ChapterWriter(std::string path, std::string edition_name, DebugChannel log)
    : TrackWriter(std::move(path), std::move(log), "w")
    , m_edition_name(std::move(edition_name)) {
}

ChapterWriter::~ChapterWriter() {
    close();
}

std::string ChapterWriter::formatChapterTime(double seconds) {
    const uint64_t ns_per_second = 1000000000ULL;
    uint64_t total_ns = seconds > 0.0 ? static_cast<uint64_t>(seconds * 1e9) : 0;

    uint64_t hours = total_ns / (3600 * ns_per_second);
    uint64_t rem = total_ns % (3600 * ns_per_second);
    uint64_t minutes = rem / (60 * ns_per_second);
    rem %= 60 * ns_per_second;
    uint64_t secs = rem / ns_per_second;
    uint64_t ns = rem % ns_per_second;

    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%02llu:%02llu:%02llu.%09llu",
             static_cast<unsigned long long>(hours),
             static_cast<unsigned long long>(minutes),
             static_cast<unsigned long long>(secs),
             static_cast<unsigned long long>(ns));
    return buffer;
}

std::string ChapterWriter::displayTitle(const Track::TrackInfo& track) {
    Track::TrackInfo::ArtistTitle split = track.artistTitle();
    if (!split.has_artist || split.artist.empty()) {
        return split.title;
    }
    return split.artist + " " + EM_DASH + " " + split.title;
}

void ChapterWriter::openDocument() {
    if (m_document_open) {
        return;
    }
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<Chapters>\n"
        << XMLUtil::getIndent(1) << "<EditionEntry>\n";
    if (!m_edition_name.empty()) {
        XMLUtil::Element edition("EditionDisplay");
        edition.add("EditionString", m_edition_name);
        out << XMLUtil::generateXML(edition, 2) << "\n";
    }
    emit(out.str());
    m_document_open = true;
}

void ChapterWriter::writeTrack(const Track::TrackInfo& track) {
    openDocument();

    uint64_t uid = m_chapter_uid++;

    XMLUtil::Element atom("ChapterAtom");
    atom.add("ChapterUID", std::to_string(uid));
    atom.add("ChapterTimeStart", formatChapterTime(track.timepos));
    atom.add("ChapterDisplay").add("ChapterString", displayTitle(track));

    emit(XMLUtil::generateXML(atom, 2) + "\n");
}

void ChapterWriter::finalize() {
    openDocument();
    emit(XMLUtil::getIndent(1) + "</EditionEntry>\n</Chapters>\n");
}

} // namespace Writer
} // namespace IcyRec
