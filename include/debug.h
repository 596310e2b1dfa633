/*
 * debug.h - Channel-based debug output system
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct includes - all includes should be in icyrec.h

class Debug {
public:
    static void init(const std::string& logfile, const std::vector<std::string>& channels);
    static void shutdown();

    // Check if a debug channel is enabled
    static bool isChannelEnabled(const std::string& channel);

    // Basic logging without location info
    template<typename... Args>
    static inline void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, "", 0, ss.str());
        }
    }

    // Logging with function and line number
    template<typename... Args>
    static inline void logAt(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            std::stringstream ss;
            if constexpr (sizeof...(args) > 0) {
                (ss << ... << args);
            }
            write(channel, function, line, ss.str());
        }
    }

private:
    static void write(const std::string& channel, const std::string& function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static bool m_log_to_file;
};

/**
 * @brief Logger handle bound to one channel and one context label
 *
 * Components that belong to a recording session receive one of these at
 * construction instead of reaching for a global channel name, so every
 * line they emit carries the stream it belongs to.
 */
class DebugChannel {
public:
    explicit DebugChannel(std::string channel, std::string context = "")
        : m_channel(std::move(channel)), m_context(std::move(context)) {}

    template<typename... Args>
    void log(Args&&... args) const {
        if (m_context.empty()) {
            Debug::log(m_channel, std::forward<Args>(args)...);
        } else {
            Debug::log(m_channel, "[", m_context, "] ", std::forward<Args>(args)...);
        }
    }

    bool enabled() const { return Debug::isChannelEnabled(m_channel); }

    // Same context, different channel
    DebugChannel on(const std::string& channel) const { return DebugChannel(channel, m_context); }

    const std::string& channel() const { return m_channel; }
    const std::string& context() const { return m_context; }

private:
    std::string m_channel;
    std::string m_context;
};

// Convenience macro for logging with location info
#define DEBUG_LOG(channel, ...) Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

#endif // DEBUG_H
