/*
 * XMLUtil.h - Small XML element model, writer and reader
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

#ifndef ICYREC_CORE_UTILITY_XMLUTIL_H
#define ICYREC_CORE_UTILITY_XMLUTIL_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Core {
namespace Utility {

/**
 * @brief Simple XML utility class for basic parsing and generation
 *
 * Lightweight XML support without external dependencies, sized for
 * documents like the Matroska chapter file. No namespaces, no DTDs, no
 * CDATA; text and child elements are not interleaved.
 */
class XMLUtil {
public:
    /**
     * @brief Simple XML element representation
     */
    struct Element {
        std::string name;
        std::string content;
        std::map<std::string, std::string> attributes;
        std::vector<Element> children;

        Element() = default;
        Element(const std::string& elementName) : name(elementName) {}
        Element(const std::string& elementName, const std::string& elementContent)
            : name(elementName), content(elementContent) {}

        // Append a child and return a reference to it
        Element& add(const std::string& childName, const std::string& childContent = "");
    };

    /**
     * @brief Parse XML string into element tree
     * @param xml The XML string to parse
     * @return Root element of the parsed XML
     * @throws std::runtime_error on malformed input
     */
    static Element parseXML(const std::string& xml);

    /**
     * @brief Generate XML string from element tree
     * @param element The root element to serialize
     * @param indent Current indentation level, two spaces per level
     * @return XML string representation, without trailing newline
     */
    static std::string generateXML(const Element& element, int indent = 0);

    static std::string getChildText(const Element& parent, const std::string& childName);
    static const Element* findChild(const Element& parent, const std::string& childName);
    static std::vector<const Element*> findChildren(const Element& parent, const std::string& childName);

    /**
     * @brief Escape XML special characters in text content
     */
    static std::string escapeXML(const std::string& text);

    /**
     * @brief Unescape the five predefined XML entities
     */
    static std::string unescapeXML(const std::string& text);

    /**
     * @brief Indentation string for the given level
     */
    static std::string getIndent(int level);

private:
    static void writeElement(std::ostream& out, const Element& element, int indent);
    static Element parseElement(const std::string& xml, size_t& pos);
    static void skipWhitespace(const std::string& xml, size_t& pos);
    static std::map<std::string, std::string> parseAttributes(const std::string& attributeString);
};

} // namespace Utility
} // namespace Core
} // namespace IcyRec

#endif // ICYREC_CORE_UTILITY_XMLUTIL_H
