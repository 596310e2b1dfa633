/*
 * HTTPIOHandler.h - Streaming HTTP source built on the libcurl multi interface
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

#ifndef HTTPIOHANDLER_H
#define HTTPIOHANDLER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace IO {
namespace HTTP {

/**
 * @brief Streaming HTTP GET exposed as an IOHandler
 *
 * open() sends the request and returns once the final response headers
 * arrived (redirects are followed). read() then pumps the transfer until
 * the caller's request is satisfied. All waiting happens in short poll
 * slices so abort() takes effect within one slice.
 */
class HTTPIOHandler : public IOHandler {
public:
    static constexpr long CONNECT_TIMEOUT = 10;    // seconds
    static constexpr long READ_TIMEOUT = 60;       // seconds without a byte
    static constexpr int POLL_SLICE_MS = 250;

    /**
     * @brief Constructor
     * @param url http:// or https:// URL
     * @param request_headers Extra request headers (name -> value)
     */
    explicit HTTPIOHandler(const std::string& url,
                           const std::map<std::string, std::string>& request_headers = {});

    ~HTTPIOHandler() override;

    /**
     * @brief Connect, send the request and wait for the response headers
     * @throws Core::ConnectionError if no response header block was received
     */
    void open();

    // IOHandler interface implementation
    size_t read(void* buffer, size_t size, size_t count) override;
    int close() override;
    bool eof() override;

    /**
     * @brief HTTP status of the final response (0 before open())
     */
    long statusCode() const { return m_status_code; }

    /**
     * @brief Response header value, case-insensitive name lookup
     * @return Value or empty string when absent
     */
    std::string getHeader(const std::string& name) const;

    const std::string& getUrl() const { return m_url; }

private:
    static size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* contents, size_t size, size_t nmemb, void* userp);

    void processHeaderLine(const std::string& line);

    // One perform + poll slice. Returns false once the transfer has ended.
    bool pump();
    void collectResult();
    size_t buffered() const { return m_buffer.size() - m_buffer_pos; }
    void releaseHandles();

    std::string m_url;
    std::map<std::string, std::string> m_request_headers;

    CURL* m_curl = nullptr;
    CURLM* m_multi = nullptr;
    struct curl_slist* m_header_list = nullptr;

    std::vector<uint8_t> m_buffer;
    size_t m_buffer_pos = 0;

    std::map<std::string, std::string> m_response_headers;  // lower-case names
    size_t m_header_bytes = 0;
    long m_status_code = 0;
    bool m_headers_complete = false;
    bool m_transfer_done = false;
    CURLcode m_transfer_result = CURLE_OK;
    std::string m_error_message;
};

} // namespace HTTP
} // namespace IO
} // namespace IcyRec

#endif // HTTPIOHANDLER_H
