/*
 * IOHandler.h - Abstract byte source interface
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

#ifndef IOHANDLER_H
#define IOHANDLER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace IO {

/**
 * @brief Base IOHandler interface for sequential byte sources
 *
 * Stream framing reads through this interface so it can be driven by a
 * live HTTP transfer or by an in-memory recording of one.
 */
class IOHandler {
public:
    IOHandler();
    virtual ~IOHandler();

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /**
     * @brief Read data from the source with fread-like semantics
     *
     * Blocks until size * count bytes are available, the source ends, an
     * error occurs or abort() is called.
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    virtual size_t read(void* buffer, size_t size, size_t count);

    /**
     * @brief Get current byte offset position
     * @return Number of bytes consumed so far, -1 if closed
     */
    virtual off_t tell();

    /**
     * @brief Close the I/O source and cleanup resources
     * @return 0 on success, standard error codes on failure
     */
    virtual int close();

    /**
     * @brief Check if at end-of-stream condition
     */
    virtual bool eof();

    /**
     * @brief Get the last error code
     * @return errno-style code (0 = no error)
     */
    virtual int getLastError() const;

    /**
     * @brief Ask a blocked or future read() to return early
     *
     * Only stores an atomic flag, so it may be called from a signal
     * handler or another thread. Implementations poll the flag at least
     * once per wait slice.
     */
    void abort() noexcept;

protected:
    std::atomic<bool> m_closed{false};   // Indicates if the handler is closed
    std::atomic<bool> m_eof{false};      // Indicates end-of-stream condition
    std::atomic<bool> m_aborted{false};  // abort() was requested
    std::atomic<off_t> m_position{0};    // Bytes consumed so far
    std::atomic<int> m_error{0};         // Last error code (0 = no error)

    // Serializes read/close against each other
    mutable std::mutex m_operation_mutex;

    // Sources only move forward
    void advancePosition(size_t bytes);
    void updateErrorState(int error_code, const std::string& error_message = "");
    void updateEofState(bool eof_state);
    void updateClosedState(bool closed_state);
};

} // namespace IO
} // namespace IcyRec

#endif // IOHANDLER_H
