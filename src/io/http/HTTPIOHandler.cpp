/*
 * HTTPIOHandler.cpp - Streaming HTTP source built on the libcurl multi interface
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace IO {
namespace HTTP {

// Thread-safe one-time global curl initialization
class CurlLifecycleManager {
public:
    static bool ensureInitialized() {
        std::call_once(s_init_flag, []() {
            CURLcode result = curl_global_init(CURL_GLOBAL_ALL);
            s_initialized.store(result == CURLE_OK);
            if (s_initialized) {
                Debug::log("http", "CurlLifecycleManager: libcurl initialized (", curl_version(), ")");
            } else {
                Debug::log("http", "CurlLifecycleManager: libcurl initialization failed: ", curl_easy_strerror(result));
            }
        });
        return s_initialized.load();
    }

private:
    static std::once_flag s_init_flag;
    static std::atomic<bool> s_initialized;
};

std::once_flag CurlLifecycleManager::s_init_flag;
std::atomic<bool> CurlLifecycleManager::s_initialized{false};

static const size_t MAX_HEADER_SIZE = 64 * 1024;
static const size_t MAX_HEADER_COUNT = 100;

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

HTTPIOHandler::HTTPIOHandler(const std::string& url, const std::map<std::string, std::string>& request_headers)
    : m_url(url), m_request_headers(request_headers) {
}

HTTPIOHandler::~HTTPIOHandler() {
    releaseHandles();
}

size_t HTTPIOHandler::writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* self = static_cast<HTTPIOHandler*>(userp);

    // Body bytes mean the final header block is behind us
    self->m_headers_complete = true;

    try {
        self->m_buffer.insert(self->m_buffer.end(), contents, contents + realsize);
    } catch (const std::bad_alloc&) {
        Debug::log("http", "HTTPIOHandler: Memory allocation failed while buffering stream data");
        return 0; // Signal error to libcurl
    }
    return realsize;
}

size_t HTTPIOHandler::headerCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* self = static_cast<HTTPIOHandler*>(userp);

    self->m_header_bytes += realsize;
    if (self->m_header_bytes > MAX_HEADER_SIZE) {
        Debug::log("http", "HTTPIOHandler: Header size limit exceeded");
        return 0; // Signal error to libcurl
    }

    std::string line(contents, realsize);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    try {
        self->processHeaderLine(line);
    } catch (const std::exception& e) {
        Debug::log("http", "HTTPIOHandler: Cannot process header line: ", e.what());
        return 0;
    }
    return realsize;
}

void HTTPIOHandler::processHeaderLine(const std::string& line) {
    // Status line of a new response. Every redirect hop starts a new block.
    if (line.compare(0, 5, "HTTP/") == 0) {
        m_response_headers.clear();
        m_headers_complete = false;
        m_status_code = 0;

        size_t space = line.find(' ');
        if (space != std::string::npos) {
            m_status_code = std::strtol(line.c_str() + space + 1, nullptr, 10);
        }
        Debug::log("http", "HTTPIOHandler: ", line);
        return;
    }

    if (line.empty()) {
        // End of a header block
        bool redirect = m_status_code >= 300 && m_status_code < 400 && m_response_headers.count("location");
        bool informational = m_status_code >= 100 && m_status_code < 200;
        if (!redirect && !informational) {
            m_headers_complete = true;
        }
        return;
    }

    size_t colonPos = line.find(':');
    if (colonPos == std::string::npos || colonPos == 0) {
        return;
    }

    std::string name = toLower(line.substr(0, colonPos));
    std::string value = line.substr(colonPos + 1);

    // Trim whitespace from value
    size_t start = value.find_first_not_of(" \t");
    if (start != std::string::npos) {
        size_t end = value.find_last_not_of(" \t");
        value = value.substr(start, end - start + 1);
    } else {
        value.clear();
    }

    if (m_response_headers.size() < MAX_HEADER_COUNT) {
        m_response_headers[name] = value;
    }
}

void HTTPIOHandler::open() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    if (m_multi) {
        return;
    }
    if (!CurlLifecycleManager::ensureInitialized()) {
        throw Core::ConnectionError("libcurl initialization failed");
    }

    m_curl = curl_easy_init();
    m_multi = curl_multi_init();
    if (!m_curl || !m_multi) {
        releaseHandles();
        throw Core::ConnectionError("Failed to create curl handles");
    }

    curl_easy_setopt(m_curl, CURLOPT_URL, m_url.c_str());
    curl_easy_setopt(m_curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(m_curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(m_curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT);
    // A stream that delivers nothing for READ_TIMEOUT seconds is dead
    curl_easy_setopt(m_curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(m_curl, CURLOPT_LOW_SPEED_TIME, READ_TIMEOUT);
    curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(m_curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(m_curl, CURLOPT_HEADERDATA, this);

    // Security and protocol options
    curl_easy_setopt(m_curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(m_curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(m_curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(m_curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(m_curl, CURLOPT_USERAGENT, ICYREC_USER_AGENT);
    curl_easy_setopt(m_curl, CURLOPT_BUFFERSIZE, 64L * 1024L);

    for (const auto& header : m_request_headers) {
        std::string headerStr = header.first + ": " + header.second;
        m_header_list = curl_slist_append(m_header_list, headerStr.c_str());
    }
    if (m_header_list) {
        curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, m_header_list);
    }

    CURLMcode mc = curl_multi_add_handle(m_multi, m_curl);
    if (mc != CURLM_OK) {
        std::string why = std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc);
        releaseHandles();
        throw Core::ConnectionError(why);
    }

    Debug::log("http", "HTTPIOHandler: GET ", m_url);

    while (!m_headers_complete && !m_transfer_done) {
        if (m_aborted.load()) {
            releaseHandles();
            throw Core::ConnectionError("Request aborted: " + m_url);
        }
        pump();
    }

    if (!m_headers_complete) {
        std::string why = m_error_message.empty() ? "Connection closed before response headers" : m_error_message;
        releaseHandles();
        throw Core::ConnectionError(why + " (" + m_url + ")");
    }

    long http_code = 0;
    if (curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &http_code) == CURLE_OK && http_code > 0) {
        m_status_code = http_code;
    }

    Debug::log("http", "HTTPIOHandler: Response ", m_status_code, " with ", m_response_headers.size(), " headers");
}

bool HTTPIOHandler::pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(m_multi, &running);
    if (mc == CURLM_OK && running > 0) {
        mc = curl_multi_poll(m_multi, nullptr, 0, POLL_SLICE_MS, nullptr);
    }

    if (mc != CURLM_OK) {
        m_error_message = std::string("libcurl multi error: ") + curl_multi_strerror(mc);
        m_transfer_done = true;
        updateErrorState(EIO, m_error_message);
        return false;
    }
    if (running == 0) {
        collectResult();
        return false;
    }
    return true;
}

void HTTPIOHandler::collectResult() {
    int pending = 0;
    CURLMsg* msg = nullptr;
    while ((msg = curl_multi_info_read(m_multi, &pending)) != nullptr) {
        if (msg->msg == CURLMSG_DONE) {
            m_transfer_result = msg->data.result;
        }
    }
    m_transfer_done = true;

    if (m_transfer_result == CURLE_OK) {
        Debug::log("http", "HTTPIOHandler: Transfer finished by server");
    } else {
        m_error_message = std::string("libcurl error: ") + curl_easy_strerror(m_transfer_result);
        updateErrorState(m_transfer_result == CURLE_OPERATION_TIMEDOUT ? ETIMEDOUT : EIO, m_error_message);
    }
}

size_t HTTPIOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }
    if (!m_multi) {
        updateErrorState(ENOTCONN);
        return 0;
    }

    size_t requested = size * count;
    if (requested == 0) {
        return 0;
    }
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    while (buffered() < requested && !m_transfer_done) {
        if (m_aborted.load()) {
            updateErrorState(EINTR, "read aborted");
            break;
        }
        pump();
    }

    size_t to_read = std::min(requested, buffered());
    if (to_read > 0) {
        std::memcpy(buffer, m_buffer.data() + m_buffer_pos, to_read);
        m_buffer_pos += to_read;
        advancePosition(to_read);
    }

    // Drop consumed bytes once they dominate the buffer
    if (m_buffer_pos > 0 && m_buffer_pos >= m_buffer.size() / 2) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + m_buffer_pos);
        m_buffer_pos = 0;
    }

    if (m_transfer_done && buffered() == 0) {
        updateEofState(true);
    }

    return to_read / size;
}

int HTTPIOHandler::close() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    releaseHandles();
    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool HTTPIOHandler::eof() {
    return m_closed.load() || m_eof.load();
}

void HTTPIOHandler::releaseHandles() {
    if (m_multi && m_curl) {
        curl_multi_remove_handle(m_multi, m_curl);
    }
    if (m_curl) {
        curl_easy_cleanup(m_curl);
        m_curl = nullptr;
    }
    if (m_multi) {
        curl_multi_cleanup(m_multi);
        m_multi = nullptr;
    }
    if (m_header_list) {
        curl_slist_free_all(m_header_list);
        m_header_list = nullptr;
    }
}

std::string HTTPIOHandler::getHeader(const std::string& name) const {
    auto it = m_response_headers.find(toLower(name));
    return it != m_response_headers.end() ? it->second : std::string();
}

} // namespace HTTP
} // namespace IO
} // namespace IcyRec
