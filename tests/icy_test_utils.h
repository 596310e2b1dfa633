/*
 * icy_test_utils.h - Helpers for building synthetic Icy streams in tests
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ICY_TEST_UTILS_H
#define ICY_TEST_UTILS_H

#include "icyrec.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace IcyTestUtils {

/**
 * @brief Length byte followed by text padded with NULs to a multiple of 16
 *
 * Empty text yields the single zero byte of a "no metadata" cycle.
 */
inline std::string metadataBlock(const std::string& text) {
    size_t blocks = (text.size() + 15) / 16;
    std::string block(1, static_cast<char>(blocks));
    block += text;
    block.append(blocks * 16 - text.size(), '\0');
    return block;
}

inline std::string streamTitle(const std::string& title, const std::string& url = "") {
    std::string text = "StreamTitle='" + title + "';";
    if (!url.empty()) {
        text += "StreamUrl='" + url + "';";
    }
    return text;
}

/**
 * @brief Builds the byte stream a server would send for a given metaint
 */
class IcyStreamBuilder {
public:
    explicit IcyStreamBuilder(size_t metaint) : m_metaint(metaint) {}

    // One cycle: metaint bytes of fill, then the metadata block
    IcyStreamBuilder& chunk(char fill, const std::string& metadata_text = "") {
        m_bytes.append(m_metaint, fill);
        m_bytes += metadataBlock(metadata_text);
        return *this;
    }

    // Arbitrary trailing bytes, e.g. a truncated cycle
    IcyStreamBuilder& raw(const std::string& bytes) {
        m_bytes += bytes;
        return *this;
    }

    const std::string& bytes() const { return m_bytes; }
    size_t metaint() const { return m_metaint; }

    std::unique_ptr<IcyRec::IO::IOHandler> source() const {
        return std::make_unique<IcyRec::IO::MemoryIOHandler>(m_bytes.data(), m_bytes.size());
    }

    std::unique_ptr<IcyRec::Icy::IcyStreamReader> reader(IcyRec::Icy::IcyStreamReader::MonotonicClock clock) const {
        return std::make_unique<IcyRec::Icy::IcyStreamReader>(source(), m_metaint, DebugChannel("icy", "test"),
                                                              std::move(clock));
    }

private:
    size_t m_metaint;
    std::string m_bytes;
};

/**
 * @brief Clock returning origin, origin + step, origin + 2 * step, ...
 */
inline IcyRec::Icy::IcyStreamReader::MonotonicClock steppingClock(double step, double origin = 100.0) {
    auto calls = std::make_shared<unsigned>(0);
    return [calls, step, origin]() {
        return origin + step * static_cast<double>((*calls)++);
    };
}

/**
 * @brief TCP listener on 127.0.0.1 with a kernel-assigned port
 */
class LoopbackListener {
public:
    LoopbackListener() {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd < 0) {
            throw std::runtime_error(std::string("socket: ") + strerror(errno));
        }
        sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(m_fd, 4) != 0 ||
            ::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            std::string why = strerror(errno);
            ::close(m_fd);
            throw std::runtime_error("loopback listener: " + why);
        }
        m_port = ntohs(addr.sin_port);
    }

    virtual ~LoopbackListener() {
        ::close(m_fd);
    }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    std::string url() const { return "http://127.0.0.1:" + std::to_string(m_port) + "/stream"; }

protected:
    int m_fd = -1;
    uint16_t m_port = 0;
};

/**
 * @brief Listener that never accepts
 *
 * The kernel completes the TCP handshake, so a client connects, sends its
 * request and then waits for response headers that never come.
 */
class SilentServer : public LoopbackListener {
};

/**
 * @brief Serves one connection: reads the request, sends response verbatim, closes
 */
class CannedServer : public LoopbackListener {
public:
    explicit CannedServer(std::string response) : m_response(std::move(response)) {
        m_thread = std::thread(&CannedServer::serve, this);
    }

    ~CannedServer() override {
        // Unblocks accept() when no client ever came
        ::shutdown(m_fd, SHUT_RDWR);
        m_thread.join();
    }

    std::string request() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_request;
    }

private:
    void serve() {
        int client = ::accept(m_fd, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        char buffer[1024];
        std::string request;
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            request.append(buffer, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_request = request;
        }
        size_t sent = 0;
        while (sent < m_response.size()) {
            ssize_t n = ::send(client, m_response.data() + sent, m_response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                break;
            }
            sent += static_cast<size_t>(n);
        }
        ::close(client);
    }

    std::string m_response;
    mutable std::mutex m_mutex;
    std::string m_request;
    std::thread m_thread;
};

} // namespace IcyTestUtils

#endif // ICY_TEST_UTILS_H
