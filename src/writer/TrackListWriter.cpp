/*
 * TrackListWriter.cpp - Plain text track list sink
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Writer {

TrackListWriter::TrackListWriter(std::string path, DebugChannel log)
    : TrackWriter(std::move(path), std::move(log)) {
}

void TrackListWriter::writeTrack(const Track::TrackInfo& track) {
    emit(track.timeposString() + " -- " + track.name + "\n");
}

} // namespace Writer
} // namespace IcyRec
