/*
 * main.cpp - contains main(), mostly.
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

#include "icyrec.h"

using IcyRec::Config::AppConfig;
using IcyRec::Config::ConfigLoader;
using IcyRec::Core::Utility::TimeUtil;
using IcyRec::Recorder::Recorder;
using IcyRec::Recorder::RecordingPolicy;
using IcyRec::Recorder::RecordingResult;

namespace {

const long long DEFAULT_DURATION = 60;

volatile std::sig_atomic_t g_stop_signal = 0;

extern "C" void handle_stop_signal(int signum) {
    g_stop_signal = signum;
}

struct RecordOptions {
    std::string config_path;
    std::string output;
    long long duration = DEFAULT_DURATION;
    bool duration_given = false;
    std::optional<TimeUtil::Clock::time_point> until;
    std::string logfile;
    std::vector<std::string> debug_channels = {"main", "recorder", "writer"};
};

std::vector<std::string> splitChannels(const std::string& text) {
    std::vector<std::string> channels;
    std::stringstream ss(text);
    std::string channel;
    while (std::getline(ss, channel, ',')) {
        if (!channel.empty()) {
            channels.push_back(channel);
        }
    }
    return channels;
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int runSessions(const RecordOptions& options) {
    AppConfig conf = ConfigLoader::load(options.config_path);

    std::string output = options.output.empty() ? conf.recording.output : options.output;
    if (!System::createDirectories(output)) {
        throw IcyRec::Core::ConfigException("Cannot create output directory '" + output + "'");
    }

    RecordingPolicy policy;
    policy.start_mode = conf.recording.start_mode;
    policy.stop_mode = conf.recording.stop_mode;
    policy.chapters = conf.recording.chapters;
    if (options.until) {
        policy.end_time = options.until;
    } else {
        policy.end_time = TimeUtil::Clock::now() + std::chrono::seconds(options.duration);
    }

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(output, ec);
    Debug::log("main", "Recording until ", TimeUtil::formatLocal(*policy.end_time, "%Y-%m-%d %H:%M:%S"),
               " into '", ec ? output : absolute.string(), "'");

    std::vector<std::unique_ptr<Recorder>> recorders;
    for (const auto& stream : conf.streams) {
        recorders.push_back(std::make_unique<Recorder>(stream, policy, output));
    }

    std::atomic<size_t> running{recorders.size()};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    installSignalHandlers();

    for (auto& recorder : recorders) {
        Recorder* session = recorder.get();
        threads.emplace_back([session, &running, &failures]() {
            System::setThisThreadName("icyrec-rec");
            DebugChannel log("main", session->stream().name);
            try {
                RecordingResult result = session->record();
                if (!result.kept) {
                    log.log("No audio captured");
                }
            } catch (const IcyRec::Core::ConnectionError& e) {
                log.log("Connection failed: ", e.what());
                ++failures;
            } catch (const std::exception& e) {
                log.log("Recording failed: ", e.what());
                ++failures;
            }
            --running;
        });
    }

    bool stop_sent = false;
    while (running.load() > 0) {
        if (g_stop_signal && !stop_sent) {
            Debug::log("main", "Interrupted! (signal ", static_cast<int>(g_stop_signal), ")");
            for (auto& recorder : recorders) {
                recorder->stop();
            }
            stop_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    for (auto& thread : threads) {
        thread.join();
    }

    return failures.load() == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
    RecordOptions options;
    options.config_path = System::getDefaultConfigPath();

    static const struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"output", required_argument, 0, 'o'},
        {"duration", required_argument, 0, 'd'},
        {"until", required_argument, 0, 'u'},
        {"logfile", required_argument, 0, 'l'},
        {"debug", required_argument, 0, 'D'},
        {"verbose", no_argument, 0, 'V'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, "c:o:d:u:vh", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'c':
                    options.config_path = optarg;
                    break;
                case 'o':
                    options.output = optarg;
                    break;
                case 'd':
                    options.duration = TimeUtil::safeInt(optarg, -1);
                    if (options.duration <= 0) {
                        throw IcyRec::Core::ArgumentException(std::string("Invalid duration '") + optarg +
                                                              "', expected a positive number of seconds");
                    }
                    options.duration_given = true;
                    break;
                case 'u':
                    options.until = TimeUtil::toTimePoint(TimeUtil::parseDateTimeArg(optarg));
                    break;
                case 'l':
                    options.logfile = optarg;
                    break;
                case 'D':
                    options.debug_channels = splitChannels(optarg);
                    break;
                case 'V':
                    options.debug_channels = {"all"};
                    break;
                case 'v':
                    IcyRec::Core::about_console();
                    return 0;
                case 'h':
                    IcyRec::Core::print_help();
                    return 0;
                case '?': // Invalid option
                    return 2; // getopt_long already prints an error message.
            }
        }
        if (options.duration_given && options.until) {
            throw IcyRec::Core::ArgumentException("--duration and --until are mutually exclusive");
        }
    } catch (const IcyRec::Core::ArgumentException& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        return 2;
    }

    if (optind < argc) {
        std::cerr << argv[0] << ": unexpected argument '" << argv[optind] << "'" << std::endl;
        return 2;
    }

    Debug::init(options.logfile, options.debug_channels);
    Debug::log("main", "START");

    int status = 1;
    try {
        status = runSessions(options);
    } catch (const std::exception& e) {
        Debug::log("main", "Fatal error: ", e.what());
        std::cerr << argv[0] << ": " << e.what() << std::endl;
    }

    Debug::log("main", "FINISHED");
    Debug::shutdown();
    return status;
}
