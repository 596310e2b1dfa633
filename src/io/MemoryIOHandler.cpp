/*
 * MemoryIOHandler.cpp - Memory-based IOHandler implementation
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

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size)
    : m_pos(0) {
    if (data && size > 0) {
        m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
    }
}

MemoryIOHandler::MemoryIOHandler()
    : m_pos(0) {
}

MemoryIOHandler::~MemoryIOHandler() {
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }
    if (m_aborted.load()) {
        updateErrorState(EINTR);
        return 0;
    }

    size_t bytes_requested = size * count;
    if (bytes_requested == 0) return 0;
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    size_t available = (m_pos < m_buffer.size()) ? m_buffer.size() - m_pos : 0;
    size_t to_read = std::min(bytes_requested, available);

    if (to_read > 0) {
        std::memcpy(buffer, m_buffer.data() + m_pos, to_read);
        m_pos += to_read;
        advancePosition(to_read);
    }

    updateEofState(m_pos >= m_buffer.size());

    return to_read / size;
}

off_t MemoryIOHandler::tell() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    return static_cast<off_t>(m_pos);
}

int MemoryIOHandler::close() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    updateClosedState(true);
    m_buffer.clear();
    m_buffer.shrink_to_fit();
    m_pos = 0;
    return 0;
}

bool MemoryIOHandler::eof() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    return m_closed.load() || m_pos >= m_buffer.size();
}

} // namespace IO
} // namespace IcyRec
