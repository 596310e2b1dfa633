/*
 * test_config_loader.cpp - Configuration loader tests
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"
#include "test_framework.h"

using namespace IcyRec::Config;
using IcyRec::Core::ConfigException;
using namespace TestFramework;
using namespace TestFramework::FileTestUtils;

namespace {

AppConfig parseText(const std::string& text) {
    std::istringstream in(text);
    return ConfigLoader::parse(in, "test.conf");
}

void assertRejected(const std::string& text, const std::string& fragment) {
    TestPatterns::assertThrows<ConfigException>([&]() { parseText(text); }, fragment,
                                                "Expected rejection containing '" + fragment + "'");
}

} // namespace

class FullConfigTest : public TestCase {
public:
    FullConfigTest() : TestCase("Recording defaults and multiple streams") {}

protected:
    void runTest() override {
        AppConfig app = parseText(
            "# comment\n"
            "; another comment\n"
            "[recording]\n"
            "output = /srv/radio\n"
            "cuesheet = yes\n"
            "tracklist = off\n"
            "chapters = false\n"
            "start_mode = on-track\n"
            "stop_mode = defer-to-next-track\n"
            "\n"
            "[stream]\n"
            "name = Radio Paradise\n"
            "url = http://stream.radioparadise.com/mp3-192\n"
            "type = mp3\n"
            "\n"
            "[Stream]\n"
            "name = \"Second Station\"\n"
            "url = HTTPS://example.org/live\n"
            "cuesheet = no\n"
            "tracklist = 1\n");

        ASSERT_EQUALS(std::string("/srv/radio"), app.recording.output, "Output directory");
        ASSERT_TRUE(app.recording.cuesheet, "Cue sheet default");
        ASSERT_FALSE(app.recording.tracklist, "Track list default");
        ASSERT_FALSE(app.recording.chapters, "Chapters");
        ASSERT_TRUE(app.recording.start_mode == CutMode::OnTrack, "Start mode");
        ASSERT_TRUE(app.recording.stop_mode == CutMode::OnTrack, "Stop mode alias");

        ASSERT_EQUALS(2u, app.streams.size(), "Two streams");
        const StreamConfig& first = app.streams[0];
        ASSERT_EQUALS(std::string("Radio Paradise"), first.name, "First name");
        ASSERT_EQUALS(std::string("mp3"), first.fileExtension(), "First extension");
        ASSERT_TRUE(first.cuesheet, "First inherits cue sheet");
        ASSERT_FALSE(first.tracklist, "First inherits track list");

        const StreamConfig& second = app.streams[1];
        ASSERT_EQUALS(std::string("Second Station"), second.name, "Quotes stripped");
        ASSERT_EQUALS(std::string("dat"), second.fileExtension(), "No type declared");
        ASSERT_FALSE(second.cuesheet, "Stream overrides cue sheet");
        ASSERT_TRUE(second.tracklist, "Stream overrides track list");
    }
};

class DefaultsTest : public TestCase {
public:
    DefaultsTest() : TestCase("Defaults without a [recording] section") {}

protected:
    void runTest() override {
        AppConfig app = parseText("[stream]\nname=X\nurl=http://h/s\n");
        ASSERT_EQUALS(std::string("./recordings"), app.recording.output, "Output");
        ASSERT_FALSE(app.recording.cuesheet, "No cue sheet");
        ASSERT_TRUE(app.recording.tracklist, "Track list");
        ASSERT_TRUE(app.recording.chapters, "Chapters");
        ASSERT_TRUE(app.recording.start_mode == CutMode::Immediate, "Start immediately");
        ASSERT_TRUE(app.recording.stop_mode == CutMode::Immediate, "Stop immediately");
        ASSERT_FALSE(app.streams[0].cuesheet, "Stream cue sheet");
        ASSERT_TRUE(app.streams[0].tracklist, "Stream track list");
    }
};

class UnknownEntriesTest : public TestCase {
public:
    UnknownEntriesTest() : TestCase("Unknown sections and keys are ignored") {}

protected:
    void runTest() override {
        AppConfig app = parseText(
            "stray = 1\n"
            "[player]\n"
            "volume = 11\n"
            "[recording]\n"
            "colour = blue\n"
            "[stream]\n"
            "name = A\n"
            "url = http://a/b\n"
            "bitrate = 128\n");
        ASSERT_EQUALS(1u, app.streams.size(), "Stream kept");
    }
};

class RejectedConfigTest : public TestCase {
public:
    RejectedConfigTest() : TestCase("Invalid configurations are rejected with a location") {}

protected:
    void runTest() override {
        assertRejected("", "no [stream]");
        assertRejected("[recording]\noutput = x\n", "no [stream]");
        assertRejected("[stream\nname=a\n", "test.conf:1: Malformed section header");
        assertRejected("[stream]\nname a\n", "test.conf:2: Expected 'key = value'");
        assertRejected("[recording]\ncuesheet = maybe\n[stream]\nname=a\nurl=http://x\n",
                       "test.conf:2: 'cuesheet' expects a boolean");
        assertRejected("[recording]\nstop_mode = later\n", "Unknown cut mode 'later'");
        assertRejected("[stream]\nurl=http://x\n", "test.conf:1: [stream] without a name");
        assertRejected("[stream]\nname=a\nurl=ftp://x/y\n", "needs an http:// or https:// url");
        assertRejected("[stream]\nname=a\n", "needs an http:// or https:// url");
    }
};

class ParseBoolTest : public TestCase {
public:
    ParseBoolTest() : TestCase("Boolean spellings") {}

protected:
    void runTest() override {
        for (const char* text : {"true", "YES", " on ", "1"}) {
            bool value = false;
            ASSERT_TRUE(ConfigLoader::parseBool(text, value), std::string("Accepted: ") + text);
            ASSERT_TRUE(value, std::string("True: ") + text);
        }
        for (const char* text : {"false", "No", "OFF", "0"}) {
            bool value = true;
            ASSERT_TRUE(ConfigLoader::parseBool(text, value), std::string("Accepted: ") + text);
            ASSERT_FALSE(value, std::string("False: ") + text);
        }
        bool untouched = true;
        ASSERT_FALSE(ConfigLoader::parseBool("2", untouched), "Rejected");
        ASSERT_TRUE(untouched, "Value unchanged on rejection");
    }
};

class CutModeTest : public TestCase {
public:
    CutModeTest() : TestCase("Cut mode names") {}

protected:
    void runTest() override {
        ASSERT_TRUE(parseCutMode(" Immediate ") == CutMode::Immediate, "immediate");
        ASSERT_TRUE(parseCutMode("ON-TRACK") == CutMode::OnTrack, "on-track");
        ASSERT_EQUALS(std::string("on-track"), std::string(cutModeName(CutMode::OnTrack)), "Name");

        std::ostringstream out;
        out << CutMode::Immediate;
        ASSERT_EQUALS(std::string("immediate"), out.str(), "Stream output");
    }
};

class LoadFileTest : public TestCase {
public:
    LoadFileTest() : TestCase("Loading from disk") {}

protected:
    void runTest() override {
        TempDirectory dir;
        std::string path = dir.file("icyrec.conf");
        {
            std::ofstream out(path);
            out << "[stream]\nname = Disk\nurl = http://disk/stream\n";
        }
        AppConfig app = ConfigLoader::load(path);
        ASSERT_EQUALS(std::string("Disk"), app.streams.at(0).name, "Loaded");

        TestPatterns::assertThrows<ConfigException>([&]() { ConfigLoader::load(dir.file("missing.conf")); },
                                                    "Cannot open configuration file");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("ConfigLoader Tests");

    suite.addTest(std::make_unique<FullConfigTest>());
    suite.addTest(std::make_unique<DefaultsTest>());
    suite.addTest(std::make_unique<UnknownEntriesTest>());
    suite.addTest(std::make_unique<RejectedConfigTest>());
    suite.addTest(std::make_unique<ParseBoolTest>());
    suite.addTest(std::make_unique<CutModeTest>());
    suite.addTest(std::make_unique<LoadFileTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
