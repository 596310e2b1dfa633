/*
 * RAIIFileHandle.cpp - RAII wrapper for FILE* handles
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

namespace IcyRec {
namespace IO {

RAIIFileHandle::RAIIFileHandle() noexcept : m_file(nullptr) {
}

RAIIFileHandle::RAIIFileHandle(FILE* file) noexcept : m_file(file) {
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept
    : m_file(other.m_file) {
    other.m_file = nullptr;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close(); // Close current handle
        m_file = other.m_file;
        other.m_file = nullptr;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const std::string& filename, const char* mode) noexcept {
    close(); // Close any existing handle

    if (filename.empty() || !mode) {
        errno = EINVAL;
        return false;
    }

    m_file = fopen(filename.c_str(), mode);
    if (!m_file) {
        int saved = errno;
        Debug::log("raii", "RAIIFileHandle::open() - Failed to open ", filename, ": ", strerror(saved));
        errno = saved;
        return false;
    }
    return true;
}

int RAIIFileHandle::close() noexcept {
    int result = 0;

    if (m_file) {
        result = fclose(m_file);
        if (result != 0) {
            Debug::log("raii", "RAIIFileHandle::close() - Error closing file: ", strerror(errno));
        }
    }

    m_file = nullptr;
    return result;
}

size_t RAIIFileHandle::write(const void* data, size_t size) noexcept {
    if (!m_file) {
        errno = EBADF;
        return 0;
    }
    if (size == 0) {
        return 0;
    }
    return fwrite(data, 1, size, m_file);
}

bool RAIIFileHandle::write(const std::string& text) noexcept {
    return write(text.data(), text.size()) == text.size();
}

bool RAIIFileHandle::flush() noexcept {
    return m_file && fflush(m_file) == 0;
}

FILE* RAIIFileHandle::get() const noexcept {
    return m_file;
}

bool RAIIFileHandle::is_valid() const noexcept {
    return m_file != nullptr;
}

RAIIFileHandle::operator bool() const noexcept {
    return is_valid();
}

} // namespace IO
} // namespace IcyRec
