/*
 * XMLUtil.cpp - Small XML element model, writer and reader
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace Core {
namespace Utility {

XMLUtil::Element& XMLUtil::Element::add(const std::string& childName, const std::string& childContent) {
    children.emplace_back(childName, childContent);
    return children.back();
}

XMLUtil::Element XMLUtil::parseXML(const std::string& xml) {
    size_t pos = 0;
    skipWhitespace(xml, pos);

    // Skip XML declaration if present
    if (xml.compare(pos, 5, "<?xml") == 0) {
        size_t end = xml.find("?>", pos);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated XML declaration");
        }
        pos = end + 2;
        skipWhitespace(xml, pos);
    }

    Element root = parseElement(xml, pos);

    skipWhitespace(xml, pos);
    if (pos < xml.length()) {
        throw std::runtime_error("Trailing content after root element at position " + std::to_string(pos));
    }
    return root;
}

std::string XMLUtil::generateXML(const Element& element, int indent) {
    std::ostringstream xml;
    writeElement(xml, element, indent);
    return xml.str();
}

void XMLUtil::writeElement(std::ostream& out, const Element& element, int indent) {
    std::string indentStr = getIndent(indent);

    out << indentStr << "<" << element.name;
    for (const auto& attr : element.attributes) {
        out << " " << attr.first << "=\"" << escapeXML(attr.second) << "\"";
    }

    if (element.children.empty() && element.content.empty()) {
        out << "/>";
        return;
    }

    out << ">" << escapeXML(element.content);
    if (!element.children.empty()) {
        out << "\n";
        for (const auto& child : element.children) {
            writeElement(out, child, indent + 1);
            out << "\n";
        }
        out << indentStr;
    }
    out << "</" << element.name << ">";
}

std::string XMLUtil::getChildText(const Element& parent, const std::string& childName) {
    const Element* child = findChild(parent, childName);
    return child ? child->content : "";
}

const XMLUtil::Element* XMLUtil::findChild(const Element& parent, const std::string& childName) {
    for (const auto& child : parent.children) {
        if (child.name == childName) {
            return &child;
        }
    }
    return nullptr;
}

std::vector<const XMLUtil::Element*> XMLUtil::findChildren(const Element& parent, const std::string& childName) {
    std::vector<const Element*> result;
    for (const auto& child : parent.children) {
        if (child.name == childName) {
            result.push_back(&child);
        }
    }
    return result;
}

std::string XMLUtil::escapeXML(const std::string& text) {
    std::string result;
    result.reserve(text.length() + text.length() / 8);

    for (char c : text) {
        switch (c) {
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '&':  result += "&amp;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default:   result += c; break;
        }
    }

    return result;
}

std::string XMLUtil::unescapeXML(const std::string& text) {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''}
    };

    std::string result;
    result.reserve(text.length());

    size_t pos = 0;
    while (pos < text.length()) {
        if (text[pos] == '&') {
            bool matched = false;
            for (const auto& entity : entities) {
                size_t len = strlen(entity.first);
                if (text.compare(pos, len, entity.first) == 0) {
                    result += entity.second;
                    pos += len;
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
        }
        result += text[pos++];
    }

    return result;
}

XMLUtil::Element XMLUtil::parseElement(const std::string& xml, size_t& pos) {
    skipWhitespace(xml, pos);

    if (pos >= xml.length() || xml[pos] != '<') {
        throw std::runtime_error("Expected '<' at position " + std::to_string(pos));
    }

    pos++; // Skip '<'

    size_t tagEnd = xml.find('>', pos);
    if (tagEnd == std::string::npos) {
        throw std::runtime_error("Unclosed tag starting at position " + std::to_string(pos - 1));
    }

    std::string tagContent = xml.substr(pos, tagEnd - pos);
    pos = tagEnd + 1;

    bool selfClosing = false;
    if (!tagContent.empty() && tagContent.back() == '/') {
        selfClosing = true;
        tagContent.pop_back();
    }

    size_t spacePos = tagContent.find_first_of(" \t\r\n");
    std::string tagName = (spacePos == std::string::npos) ?
                          tagContent : tagContent.substr(0, spacePos);
    if (tagName.empty()) {
        throw std::runtime_error("Empty tag name at position " + std::to_string(tagEnd));
    }

    Element element(tagName);

    if (spacePos != std::string::npos) {
        element.attributes = parseAttributes(tagContent.substr(spacePos + 1));
    }

    if (selfClosing) {
        return element;
    }

    const std::string closingTag = "</" + tagName + ">";

    while (true) {
        skipWhitespace(xml, pos);
        if (pos >= xml.length()) {
            throw std::runtime_error("Missing closing tag for: " + tagName);
        }

        if (xml.compare(pos, closingTag.length(), closingTag) == 0) {
            pos += closingTag.length();
            break;
        }

        if (xml.compare(pos, 2, "</") == 0) {
            throw std::runtime_error("Mismatched closing tag inside: " + tagName);
        }

        if (xml[pos] == '<') {
            element.children.push_back(parseElement(xml, pos));
        } else {
            size_t textEnd = xml.find('<', pos);
            if (textEnd == std::string::npos) {
                throw std::runtime_error("Missing closing tag for: " + tagName);
            }

            std::string text = xml.substr(pos, textEnd - pos);
            size_t end = text.find_last_not_of(" \t\r\n");
            if (end != std::string::npos) {
                element.content += unescapeXML(text.substr(0, end + 1));
            }
            pos = textEnd;
        }
    }

    return element;
}

void XMLUtil::skipWhitespace(const std::string& xml, size_t& pos) {
    while (pos < xml.length() && std::isspace(static_cast<unsigned char>(xml[pos]))) {
        pos++;
    }
}

std::map<std::string, std::string> XMLUtil::parseAttributes(const std::string& attributeString) {
    std::map<std::string, std::string> attributes;
    size_t pos = 0;

    while (pos < attributeString.length()) {
        while (pos < attributeString.length() && std::isspace(static_cast<unsigned char>(attributeString[pos]))) {
            pos++;
        }
        if (pos >= attributeString.length()) break;

        size_t nameStart = pos;
        while (pos < attributeString.length() && attributeString[pos] != '=' &&
               !std::isspace(static_cast<unsigned char>(attributeString[pos]))) {
            pos++;
        }
        std::string name = attributeString.substr(nameStart, pos - nameStart);

        while (pos < attributeString.length() &&
               (std::isspace(static_cast<unsigned char>(attributeString[pos])) || attributeString[pos] == '=')) {
            pos++;
        }
        if (pos >= attributeString.length()) break;

        char quote = attributeString[pos];
        if (quote != '"' && quote != '\'') {
            throw std::runtime_error("Unquoted value for attribute: " + name);
        }
        size_t valueEnd = attributeString.find(quote, pos + 1);
        if (valueEnd == std::string::npos) {
            throw std::runtime_error("Unterminated value for attribute: " + name);
        }
        attributes[name] = unescapeXML(attributeString.substr(pos + 1, valueEnd - pos - 1));
        pos = valueEnd + 1;
    }

    return attributes;
}

std::string XMLUtil::getIndent(int level) {
    return std::string(level * 2, ' '); // 2 spaces per level
}

} // namespace Utility
} // namespace Core
} // namespace IcyRec
