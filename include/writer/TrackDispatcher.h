/*
 * TrackDispatcher.h - Fan-out of track events to the sinks
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

#ifndef ICYREC_WRITER_TRACKDISPATCHER_H
#define ICYREC_WRITER_TRACKDISPATCHER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Writer {

/**
 * @brief Delivers track events to a set of sinks on a background thread
 *
 * The recording loop posts events and goes straight back to reading the
 * network; a single worker thread hands each event to every sink in
 * posting order. The queue is bounded: when sink I/O falls far behind,
 * post() blocks until the worker catches up.
 *
 * finish() drains the queue, joins the worker and closes every sink. After
 * that, removeArtifacts() deletes whatever the sinks created.
 */
class TrackDispatcher {
public:
    static const size_t DEFAULT_CAPACITY = 64;

    TrackDispatcher(std::vector<std::unique_ptr<TrackWriter>> writers, DebugChannel log,
                    size_t capacity = DEFAULT_CAPACITY);
    ~TrackDispatcher();

    TrackDispatcher(const TrackDispatcher&) = delete;
    TrackDispatcher& operator=(const TrackDispatcher&) = delete;

    // false once finish() has been called
    bool post(Track::TrackInfo track);

    void finish();
    void removeArtifacts() noexcept;

    size_t writerCount() const { return m_writers.size(); }
    const std::vector<std::unique_ptr<TrackWriter>>& writers() const { return m_writers; }

    // Events handed to the sinks so far
    uint64_t delivered() const { return m_delivered.load(); }

private:
    void workerLoop();

    std::vector<std::unique_ptr<TrackWriter>> m_writers;
    DebugChannel m_log;
    BoundedQueue<Track::TrackInfo> m_queue;
    std::thread m_worker;
    std::mutex m_finish_mutex;
    bool m_finished = false;
    std::atomic<uint64_t> m_delivered{0};
};

} // namespace Writer
} // namespace IcyRec

#endif // ICYREC_WRITER_TRACKDISPATCHER_H
