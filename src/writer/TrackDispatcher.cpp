/*
 * TrackDispatcher.cpp - Fan-out of track events to the sinks
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Writer {

TrackDispatcher::TrackDispatcher(std::vector<std::unique_ptr<TrackWriter>> writers, DebugChannel log,
                                 size_t capacity)
    : m_writers(std::move(writers))
    , m_log(std::move(log))
    , m_queue(capacity) {
    if (!m_writers.empty()) {
        m_worker = std::thread(&TrackDispatcher::workerLoop, this);
        DEBUG_LOG("writer", "dispatch thread started for ", m_writers.size(), " sinks");
    }
}

TrackDispatcher::~TrackDispatcher() {
    finish();
}

bool TrackDispatcher::post(Track::TrackInfo track) {
    if (m_writers.empty()) {
        return !m_queue.isClosed();
    }
    if (!m_queue.push(std::move(track))) {
        m_log.log("Dispatcher finished, track event dropped");
        return false;
    }
    return true;
}

void TrackDispatcher::workerLoop() {
    System::setThisThreadName("icyrec-dispatch");

    Track::TrackInfo track;
    while (m_queue.pop(track)) {
        for (auto& writer : m_writers) {
            writer->addTrack(track);
        }
        ++m_delivered;
    }
    DEBUG_LOG("writer", "dispatch thread exiting after ", m_delivered.load(), " events");
}

void TrackDispatcher::finish() {
    std::lock_guard<std::mutex> lock(m_finish_mutex);
    if (m_finished) {
        return;
    }
    m_finished = true;

    m_queue.close();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    for (auto& writer : m_writers) {
        writer->close();
    }
}

void TrackDispatcher::removeArtifacts() noexcept {
    for (auto& writer : m_writers) {
        writer->remove();
    }
}

} // namespace Writer
} // namespace IcyRec
