/*
 * IcyMetadataParser.h - Parser for inline Icy metadata blocks
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

#ifndef ICYREC_ICY_ICYMETADATAPARSER_H
#define ICYREC_ICY_ICYMETADATAPARSER_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Icy {

// Lower-cased key -> value, e.g. "streamtitle" -> "Artist - Title"
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Parser for the length-prefixed text blocks of the Icy protocol
 *
 * A block looks like
 *   StreamTitle='Led Zeppelin - Kashmir';StreamUrl='http://...';\0\0\0
 * Trailing NUL padding is removed, the text is decoded as UTF-8 (Latin-1
 * when that fails) and all key='value' pairs are extracted. Blocks with no
 * single-quoted pair are searched for key="value" pairs instead. Anything
 * else is ignored; the parser never throws.
 */
class IcyMetadataParser {
public:
    static Metadata parse(const uint8_t* data, size_t size);
    static Metadata parse(const std::vector<uint8_t>& block);
    static Metadata parse(const std::string& block);

    // Length of the block without its trailing NUL padding
    static size_t stripPadding(const uint8_t* data, size_t size);
};

} // namespace Icy
} // namespace IcyRec

#endif // ICYREC_ICY_ICYMETADATAPARSER_H
