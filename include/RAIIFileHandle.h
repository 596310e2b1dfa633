/*
 * RAIIFileHandle.h - RAII wrapper for FILE* handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace IO {

/**
 * @brief RAII wrapper for FILE* handles with automatic cleanup
 *
 * Owns the handle of an output file and closes it on destruction. Used
 * for the audio capture file and the append-per-track sidecar files.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept;

    /**
     * @brief Constructor that takes ownership of a FILE* handle
     * @param file FILE* handle to manage (can be nullptr)
     */
    explicit RAIIFileHandle(FILE* file) noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    /**
     * @brief Destructor - automatically closes the file
     */
    ~RAIIFileHandle() noexcept;

    // Delete copy constructor and copy assignment to prevent accidental copying
    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Open a file with RAII management
     * @param filename Path to the file to open
     * @param mode File open mode (e.g., "wb", "a")
     * @return true if file was opened successfully, false otherwise (errno is kept)
     */
    bool open(const std::string& filename, const char* mode) noexcept;

    /**
     * @brief Close the file handle
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;

    /**
     * @brief Write a block of bytes
     * @return Number of bytes written; less than size means the write failed
     */
    size_t write(const void* data, size_t size) noexcept;

    /**
     * @brief Write a string
     * @return true if every byte was written
     */
    bool write(const std::string& text) noexcept;

    /**
     * @brief Flush stdio buffers to the OS
     * @return true on success
     */
    bool flush() noexcept;

    FILE* get() const noexcept;
    bool is_valid() const noexcept;
    explicit operator bool() const noexcept;

private:
    FILE* m_file;           // The managed FILE* handle
};

} // namespace IO
} // namespace IcyRec

#endif // RAIIFILEHANDLE_H
