/*
 * Recorder.cpp - Recording session and cut-boundary state machine
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

using IcyRec::Config::CutMode;
using IcyRec::Core::Utility::TimeUtil;

namespace IcyRec {
namespace Recorder {

const char* stateName(RecorderState state) {
    switch (state) {
        case RecorderState::Skipping:           return "skipping";
        case RecorderState::Recording:          return "recording";
        case RecorderState::StoppingAtBoundary: return "stopping-at-boundary";
        case RecorderState::Stopped:            return "stopped";
    }
    return "unknown";
}

Recorder::Recorder(Config::StreamConfig stream, RecordingPolicy policy, std::string output_dir)
    : m_stream(std::move(stream))
    , m_policy(std::move(policy))
    , m_output_dir(std::move(output_dir))
    , m_log("recorder", m_stream.name) {
}

Recorder::~Recorder() = default;

std::string Recorder::sanitizeName(const std::string& name) {
    static const std::regex unsafe(R"([^\w\-\.\(\)\[\]])");
    static const std::regex repeated("__+");

    std::string result = std::regex_replace(name, unsafe, "_");
    result = std::regex_replace(result, repeated, "_");
    return result.empty() ? std::string("stream") : result;
}

std::string Recorder::audioFileName(Clock::time_point session_start) const {
    return sanitizeName(m_stream.name) + "_" + TimeUtil::formatLocal(session_start, "%Y%m%d-%H%M%S")
        + "." + m_stream.fileExtension();
}

void Recorder::setState(RecorderState state) {
    RecorderState previous = m_state.exchange(state);
    if (previous != state) {
        DEBUG_LOG("recorder", "[", m_stream.name, "] ", stateName(previous), " -> ", stateName(state));
    }
}

void Recorder::attach(Icy::IcyStreamReader* reader) {
    std::lock_guard<std::mutex> lock(m_reader_mutex);
    m_reader = reader;
    if (m_reader && m_stop_requested.load()) {
        m_reader->stop();
    }
}

void Recorder::attachSource(IO::IOHandler* source) {
    std::lock_guard<std::mutex> lock(m_reader_mutex);
    m_connecting = source;
    if (m_connecting && m_stop_requested.load()) {
        m_connecting->abort();
    }
}

void Recorder::stop() noexcept {
    m_stop_requested.store(true);
    std::lock_guard<std::mutex> lock(m_reader_mutex);
    if (m_connecting) {
        m_connecting->abort();
    }
    if (m_reader) {
        m_reader->stop();
    }
}

std::vector<std::unique_ptr<Writer::TrackWriter>>
Recorder::createWriters(const std::filesystem::path& audio_path, const std::string& audio_name) const {
    std::vector<std::unique_ptr<Writer::TrackWriter>> writers;
    DebugChannel writer_log = m_log.on("writer");

    if (m_stream.cuesheet) {
        std::filesystem::path path = audio_path;
        path.replace_extension(".cue");
        writers.push_back(std::make_unique<Writer::CueSheetWriter>(m_stream.name, audio_name, path.string(), writer_log));
    }
    if (m_stream.tracklist) {
        std::filesystem::path path = audio_path;
        path.replace_extension(".txt");
        writers.push_back(std::make_unique<Writer::TrackListWriter>(path.string(), writer_log));
    }
    if (m_policy.chapters) {
        std::filesystem::path path = audio_path;
        path.replace_extension(".xml");
        writers.push_back(std::make_unique<Writer::ChapterWriter>(path.string(), m_stream.name, writer_log));
    }
    return writers;
}

RecordingResult Recorder::record() {
    if (m_stop_requested.load()) {
        m_log.log("Stop requested before connecting");
        return RecordingResult();
    }
    m_log.log("Connecting to ", m_stream.url);
    DebugChannel icy_log = m_log.on("icy");
    std::unique_ptr<IO::HTTP::HTTPIOHandler> source = Icy::IcyStreamReader::createSource(m_stream);

    size_t metaint = 0;
    attachSource(source.get());
    try {
        metaint = Icy::IcyStreamReader::negotiate(*source, icy_log);
    } catch (const Core::ConnectionError&) {
        attachSource(nullptr);
        if (m_stop_requested.load()) {
            m_log.log("Stopped while connecting");
            return RecordingResult();
        }
        throw;
    } catch (...) {
        attachSource(nullptr);
        throw;
    }
    attachSource(nullptr);

    Icy::IcyStreamReader reader(std::move(source), metaint, icy_log);
    return record(reader);
}

RecordingResult Recorder::record(Icy::IcyStreamReader& reader, Clock::time_point session_start) {
    RecordingResult result;

    std::string audio_name = audioFileName(session_start);
    std::filesystem::path audio_path = std::filesystem::path(m_output_dir) / audio_name;
    result.audio_file = audio_path.string();

    IO::RAIIFileHandle audio;
    if (!audio.open(result.audio_file, "wb")) {
        std::string reason = strerror(errno);
        reader.stop();
        throw Core::RecordingException("Cannot create '" + result.audio_file + "': " + reason);
    }

    Writer::TrackDispatcher dispatcher(createWriters(audio_path, audio_name), m_log.on("writer"));

    bool recording = m_policy.start_mode == CutMode::Immediate;
    bool wants_to_stop = false;
    double record_start = 0.0;
    uint64_t filepos = 0;

    setState(recording ? RecorderState::Recording : RecorderState::Skipping);
    m_log.log("Recording into '", result.audio_file, "' (start: ", m_policy.start_mode,
              ", stop: ", m_policy.stop_mode, ")");

    auto teardown = [&]() {
        reader.stop();
        attach(nullptr);

        if (audio.close() != 0) {
            m_log.log("Closing '", result.audio_file, "' failed: ", strerror(errno));
        }
        dispatcher.finish();

        result.bytes_written = filepos;
        if (filepos == 0) {
            std::error_code ec;
            std::filesystem::remove(audio_path, ec);
            if (ec) {
                m_log.log("Removing empty '", result.audio_file, "' failed: ", ec.message());
            }
            dispatcher.removeArtifacts();
            result.kept = false;
            m_log.log("Nothing recorded, output removed");
        } else {
            result.kept = true;
            m_log.log("Recorded ", filepos, " bytes, ", result.tracks_dispatched, " tracks into '",
                      result.audio_file, "'");
        }
        setState(RecorderState::Stopped);
    };

    attach(&reader);
    try {
        Icy::StreamChunk chunk;
        while (reader.next(chunk)) {
            Clock::time_point blocktime = session_start +
                std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(chunk.timestamp));

            if (m_policy.end_time && blocktime >= *m_policy.end_time) {
                if (m_policy.stop_mode == CutMode::Immediate) {
                    m_log.log("End time reached");
                    break;
                }
                if (!wants_to_stop) {
                    if (filepos == 0) {
                        m_log.log("End time reached before anything was recorded");
                        break;
                    }
                    m_log.log("Stopping at track end");
                    wants_to_stop = true;
                    setState(RecorderState::StoppingAtBoundary);
                }
            }

            if (!chunk.metadata.empty()) {
                ++result.tracks_seen;
                if (wants_to_stop) {
                    m_log.log("Track changed, stopping");
                    break;
                }
                if (!recording && result.tracks_seen > 1) {
                    recording = true;
                    record_start = chunk.timestamp;
                    setState(RecorderState::Recording);
                }

                double timepos = recording ? chunk.timestamp - record_start : 0.0;
                Track::TrackInfo track = Track::TrackInfo::fromMetadata(filepos, timepos, chunk.metadata);
                if (recording) {
                    m_log.log("Recording: '", track.name, "' @ ", track.timeposString());
                    if (dispatcher.post(std::move(track))) {
                        ++result.tracks_dispatched;
                    }
                } else {
                    m_log.log("Skipping: '", track.name, "'");
                }
            }

            if (recording) {
                size_t written = audio.write(chunk.audio.data(), chunk.audio.size());
                filepos += written;
                if (written != chunk.audio.size()) {
                    m_log.log("Writing to '", result.audio_file, "' failed: ", strerror(errno));
                    break;
                }
            }
        }
    } catch (...) {
        teardown();
        throw;
    }

    teardown();
    return result;
}

} // namespace Recorder
} // namespace IcyRec
