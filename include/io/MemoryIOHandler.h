/*
 * MemoryIOHandler.h - Memory-based IOHandler implementation
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

#ifndef MEMORYIOHANDLER_H
#define MEMORYIOHANDLER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace IO {

/**
 * @brief Memory-based IOHandler implementation
 *
 * Plays back a byte buffer as if it were a live stream. A read that asks
 * for more than is buffered returns what is there, which a stream reader
 * treats as the end of the stream.
 */
class MemoryIOHandler : public IOHandler {
public:
    /**
     * @brief Construct from existing data (copied)
     */
    MemoryIOHandler(const void* data, size_t size);

    // Empty source, ends at the first read
    MemoryIOHandler();

    ~MemoryIOHandler() override;

    // IOHandler interface
    size_t read(void* buffer, size_t size, size_t count) override;
    off_t tell() override;
    int close() override;
    bool eof() override;

private:
    std::vector<uint8_t> m_buffer;
    size_t m_pos = 0;
};

} // namespace IO
} // namespace IcyRec

#endif // MEMORYIOHANDLER_H
