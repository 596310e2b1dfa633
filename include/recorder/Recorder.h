/*
 * Recorder.h - Recording session and cut-boundary state machine
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

#ifndef ICYREC_RECORDER_RECORDER_H
#define ICYREC_RECORDER_RECORDER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Recorder {

enum class RecorderState {
    Skipping,               ///< Waiting for the first track boundary, nothing written
    Recording,              ///< Audio is appended, track events go to the sinks
    StoppingAtBoundary,     ///< End time passed, still writing until the track changes
    Stopped
};

const char* stateName(RecorderState state);

struct RecordingPolicy {
    std::optional<Core::Utility::TimeUtil::Clock::time_point> end_time;
    Config::CutMode start_mode = Config::CutMode::Immediate;
    Config::CutMode stop_mode = Config::CutMode::Immediate;
    bool chapters = true;
};

struct RecordingResult {
    std::string audio_file;
    uint64_t bytes_written = 0;
    unsigned tracks_seen = 0;           ///< Metadata events, skipped ones included
    unsigned tracks_dispatched = 0;
    bool kept = false;                  ///< false when nothing was captured and the output was removed
};

/**
 * @brief Records one stream into a file plus its side artifacts
 *
 * A session reads chunks from an IcyStreamReader, decides when recording
 * starts and stops relative to track boundaries, appends audio to
 * <name>_<YYYYmmdd-HHMMSS>.<type> and posts a TrackInfo for every track
 * change to the sinks (cue sheet, track list, chapters).
 *
 * With CutMode::OnTrack as start mode the track already playing when the
 * connection opens is skipped; elapsed times and byte offsets are then
 * measured from the first boundary. With CutMode::OnTrack as stop mode the
 * current track is finished after the end time passed.
 *
 * A session that wrote no audio leaves no files behind.
 */
class Recorder {
public:
    using Clock = Core::Utility::TimeUtil::Clock;

    Recorder(Config::StreamConfig stream, RecordingPolicy policy, std::string output_dir);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    /**
     * @brief Connect to the stream and record until the policy or stop() ends it
     *
     * stop() also cuts the connection attempt short; the session then
     * returns an empty result.
     * @throws Core::ConnectionError if the stream cannot be opened
     * @throws Core::RecordingException if the audio file cannot be created
     */
    RecordingResult record();

    // Record from an already opened reader. session_start is the wall-clock
    // instant that chunk timestamps are relative to.
    RecordingResult record(Icy::IcyStreamReader& reader, Clock::time_point session_start = Clock::now());

    // Ends a running session from another thread. A later record() returns at once.
    void stop() noexcept;

    RecorderState state() const { return m_state.load(); }
    const Config::StreamConfig& stream() const { return m_stream; }
    const RecordingPolicy& policy() const { return m_policy; }

    std::string audioFileName(Clock::time_point session_start) const;

    // Replace anything outside [A-Za-z0-9_.()[]-] by '_' and collapse runs of '_'
    static std::string sanitizeName(const std::string& name);

private:
    std::vector<std::unique_ptr<Writer::TrackWriter>> createWriters(const std::filesystem::path& audio_path,
                                                                    const std::string& audio_name) const;
    void attach(Icy::IcyStreamReader* reader);
    void attachSource(IO::IOHandler* source);
    void setState(RecorderState state);

    Config::StreamConfig m_stream;
    RecordingPolicy m_policy;
    std::string m_output_dir;
    DebugChannel m_log;

    std::atomic<RecorderState> m_state{RecorderState::Stopped};
    std::atomic<bool> m_stop_requested{false};
    std::mutex m_reader_mutex;
    Icy::IcyStreamReader* m_reader = nullptr;
    IO::IOHandler* m_connecting = nullptr;     // Source still waiting for its response headers
};

} // namespace Recorder
} // namespace IcyRec

#endif // ICYREC_RECORDER_RECORDER_H
