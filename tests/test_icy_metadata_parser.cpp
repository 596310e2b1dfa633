/*
 * test_icy_metadata_parser.cpp - Unit tests for the Icy metadata block parser
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"
#include "test_framework.h"

using namespace IcyRec::Icy;
using namespace TestFramework;

namespace {

std::string padded(const std::string& text, size_t total) {
    std::string block = text;
    block.append(total - text.size(), '\0');
    return block;
}

} // namespace

class StreamTitleTest : public TestCase {
public:
    StreamTitleTest() : TestCase("StreamTitle and StreamUrl") {}

protected:
    void runTest() override {
        Metadata meta = IcyMetadataParser::parse(
            padded("StreamTitle='Led Zeppelin - Kashmir';StreamUrl='http://img.example/cover.jpg';", 96));

        ASSERT_EQUALS(2u, meta.size(), "Two pairs expected");
        ASSERT_EQUALS(std::string("Led Zeppelin - Kashmir"), meta["streamtitle"], "Title");
        ASSERT_EQUALS(std::string("http://img.example/cover.jpg"), meta["streamurl"], "Url");
    }
};

class EmptyBlockTest : public TestCase {
public:
    EmptyBlockTest() : TestCase("Empty and NUL-only blocks") {}

protected:
    void runTest() override {
        ASSERT_TRUE(IcyMetadataParser::parse(std::string()).empty(), "Empty input");
        ASSERT_TRUE(IcyMetadataParser::parse(std::string(32, '\0')).empty(), "NUL padding only");
        ASSERT_TRUE(IcyMetadataParser::parse(nullptr, 16).empty(), "Null pointer");
        ASSERT_EQUALS(0u, IcyMetadataParser::stripPadding(reinterpret_cast<const uint8_t*>("\0\0\0"), 3),
                      "All padding stripped");
    }
};

class KeyNormalizationTest : public TestCase {
public:
    KeyNormalizationTest() : TestCase("Keys lower-cased, values trimmed") {}

protected:
    void runTest() override {
        Metadata meta = IcyMetadataParser::parse(std::string("STREAMTITLE='  Spaced Out  ';"));
        ASSERT_EQUALS(1u, meta.count("streamtitle"), "Lower-cased key");
        ASSERT_EQUALS(std::string("Spaced Out"), meta["streamtitle"], "Trimmed value");
    }
};

class EmptyValueTest : public TestCase {
public:
    EmptyValueTest() : TestCase("Empty values are kept") {}

protected:
    void runTest() override {
        Metadata meta = IcyMetadataParser::parse(std::string("StreamTitle='';StreamUrl='';"));
        ASSERT_EQUALS(2u, meta.size(), "Both keys present");
        ASSERT_EQUALS(std::string(), meta["streamtitle"], "Empty title");
    }
};

class DoubleQuoteFallbackTest : public TestCase {
public:
    DoubleQuoteFallbackTest() : TestCase("Double-quoted fallback") {}

protected:
    void runTest() override {
        Metadata meta = IcyMetadataParser::parse(std::string("StreamTitle=\"Artist - Song\";"));
        ASSERT_EQUALS(std::string("Artist - Song"), meta["streamtitle"], "Double quotes accepted");

        meta = IcyMetadataParser::parse(std::string("StreamTitle=\"Guns N' Roses - Patience\";StreamUrl=\"http://x/c.jpg\";"));
        ASSERT_EQUALS(2u, meta.size(), "Both double-quoted pairs");
        ASSERT_EQUALS(std::string("Guns N' Roses - Patience"), meta["streamtitle"], "Apostrophe inside double quotes");
        ASSERT_EQUALS(std::string("http://x/c.jpg"), meta["streamurl"], "Second pair");

        // Single-quoted pairs win; double-quoted ones are then ignored
        meta = IcyMetadataParser::parse(std::string("StreamTitle='A';StreamUrl=\"B\";"));
        ASSERT_EQUALS(1u, meta.size(), "Only the single-quoted pair");
        ASSERT_EQUALS(0u, meta.count("streamurl"), "Double-quoted pair ignored");
    }
};

class EncodingFallbackTest : public TestCase {
public:
    EncodingFallbackTest() : TestCase("UTF-8 with Latin-1 fallback") {}

protected:
    void runTest() override {
        Metadata utf8 = IcyMetadataParser::parse(std::string("StreamTitle='Caf\xC3\xA9 del Mar';"));
        ASSERT_EQUALS(std::string("Caf\xC3\xA9 del Mar"), utf8["streamtitle"], "Valid UTF-8 unchanged");

        Metadata latin1 = IcyMetadataParser::parse(std::string("StreamTitle='Caf\xE9 del Mar';"));
        ASSERT_EQUALS(std::string("Caf\xC3\xA9 del Mar"), latin1["streamtitle"], "Latin-1 re-encoded");
    }
};

class GarbageTest : public TestCase {
public:
    GarbageTest() : TestCase("Unparseable text yields nothing") {}

protected:
    void runTest() override {
        ASSERT_TRUE(IcyMetadataParser::parse(std::string("no pairs in here")).empty(), "Plain text");
        ASSERT_TRUE(IcyMetadataParser::parse(std::string("StreamTitle='unterminated")).empty(), "Unterminated");
        std::string binary;
        for (int i = 1; i < 256; ++i) {
            binary.push_back(static_cast<char>(i));
        }
        TestPatterns::assertNoThrow([&]() { IcyMetadataParser::parse(binary); }, "Binary input");
    }
};

class DuplicateKeyTest : public TestCase {
public:
    DuplicateKeyTest() : TestCase("Last duplicate key wins") {}

protected:
    void runTest() override {
        Metadata meta = IcyMetadataParser::parse(std::string("StreamTitle='first';StreamTitle='second';"));
        ASSERT_EQUALS(std::string("second"), meta["streamtitle"], "Later value");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Icy Metadata Parser Tests");

    suite.addTest(std::make_unique<StreamTitleTest>());
    suite.addTest(std::make_unique<EmptyBlockTest>());
    suite.addTest(std::make_unique<KeyNormalizationTest>());
    suite.addTest(std::make_unique<EmptyValueTest>());
    suite.addTest(std::make_unique<DoubleQuoteFallbackTest>());
    suite.addTest(std::make_unique<EncodingFallbackTest>());
    suite.addTest(std::make_unique<GarbageTest>());
    suite.addTest(std::make_unique<DuplicateKeyTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
