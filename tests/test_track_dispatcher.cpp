/*
 * test_track_dispatcher.cpp - Tests for the sink fan-out worker
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"
#include "test_framework.h"

using IcyRec::Track::TrackInfo;
using IcyRec::Writer::TrackDispatcher;
using IcyRec::Writer::TrackListWriter;
using IcyRec::Writer::TrackWriter;
using namespace TestFramework;
using namespace TestFramework::FileTestUtils;

namespace {

struct SinkLog {
    std::mutex mutex;
    std::vector<std::string> events;

    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

// Records calls into a shared log, optionally slowly or failing
class RecordingSink : public TrackWriter {
public:
    RecordingSink(std::string tag, std::shared_ptr<SinkLog> log,
                  std::chrono::milliseconds delay = std::chrono::milliseconds(0), bool failing = false)
        : TrackWriter("/nonexistent/" + tag, DebugChannel("writer", tag))
        , m_tag(std::move(tag)), m_sink_log(std::move(log)), m_delay(delay), m_failing(failing) {}

    const char* kind() const override { return "recording sink"; }

protected:
    void writeTrack(const TrackInfo& track) override {
        if (m_delay.count() > 0) {
            std::this_thread::sleep_for(m_delay);
        }
        if (m_failing) {
            throw std::runtime_error("simulated failure");
        }
        m_sink_log->add(m_tag + ":" + track.name);
    }

    void finalize() override {
        m_sink_log->add(m_tag + ":close");
    }

private:
    std::string m_tag;
    std::shared_ptr<SinkLog> m_sink_log;
    std::chrono::milliseconds m_delay;
    bool m_failing;
};

} // namespace

class DispatchOrderTest : public TestCase {
public:
    DispatchOrderTest() : TestCase("Events reach every sink in order, then close") {}

protected:
    void runTest() override {
        auto log = std::make_shared<SinkLog>();
        std::vector<std::unique_ptr<TrackWriter>> writers;
        writers.push_back(std::make_unique<RecordingSink>("a", log));
        writers.push_back(std::make_unique<RecordingSink>("b", log, std::chrono::milliseconds(5)));

        TrackDispatcher dispatcher(std::move(writers), DebugChannel("writer", "test"));
        ASSERT_TRUE(dispatcher.post(TrackInfo(0, 0.0, "one")), "post one");
        ASSERT_TRUE(dispatcher.post(TrackInfo(1, 1.0, "two")), "post two");
        ASSERT_TRUE(dispatcher.post(TrackInfo(2, 2.0, "three")), "post three");
        dispatcher.finish();

        std::vector<std::string> expected = {
            "a:one", "b:one", "a:two", "b:two", "a:three", "b:three", "a:close", "b:close"
        };
        std::vector<std::string> actual = log->snapshot();
        ASSERT_EQUALS(expected.size(), actual.size(), "Event count");
        for (size_t i = 0; i < expected.size(); ++i) {
            ASSERT_EQUALS(expected[i], actual[i], "Event order");
        }
        ASSERT_EQUALS(3u, dispatcher.delivered(), "Delivered count");
        ASSERT_FALSE(dispatcher.post(TrackInfo(3, 3.0, "late")), "Post after finish is refused");
    }
};

class FailingSinkIsolationTest : public TestCase {
public:
    FailingSinkIsolationTest() : TestCase("A failing sink does not affect the others") {}

protected:
    void runTest() override {
        auto log = std::make_shared<SinkLog>();
        std::vector<std::unique_ptr<TrackWriter>> writers;
        writers.push_back(std::make_unique<RecordingSink>("bad", log, std::chrono::milliseconds(0), true));
        writers.push_back(std::make_unique<RecordingSink>("good", log));
        TrackWriter* bad = writers[0].get();

        TrackDispatcher dispatcher(std::move(writers), DebugChannel("writer", "test"));
        dispatcher.post(TrackInfo(0, 0.0, "x"));
        dispatcher.post(TrackInfo(0, 1.0, "y"));
        dispatcher.finish();

        std::vector<std::string> actual = log->snapshot();
        std::vector<std::string> expected = {"good:x", "good:y", "bad:close", "good:close"};
        ASSERT_EQUALS(expected.size(), actual.size(), "Only the good sink wrote tracks");
        for (size_t i = 0; i < expected.size(); ++i) {
            ASSERT_EQUALS(expected[i], actual[i], "Event order");
        }
        ASSERT_EQUALS(2u, bad->failureCount(), "Failures counted on the bad sink");
    }
};

class BackpressureTest : public TestCase {
public:
    BackpressureTest() : TestCase("A full queue blocks the producer without losing events") {}

protected:
    void runTest() override {
        auto log = std::make_shared<SinkLog>();
        std::vector<std::unique_ptr<TrackWriter>> writers;
        writers.push_back(std::make_unique<RecordingSink>("slow", log, std::chrono::milliseconds(2)));

        TrackDispatcher dispatcher(std::move(writers), DebugChannel("writer", "test"), 2);
        for (int i = 0; i < 20; ++i) {
            ASSERT_TRUE(dispatcher.post(TrackInfo(i, i, std::to_string(i))), "post");
        }
        dispatcher.finish();

        std::vector<std::string> actual = log->snapshot();
        ASSERT_EQUALS(21u, actual.size(), "All events plus close");
        for (int i = 0; i < 20; ++i) {
            ASSERT_EQUALS("slow:" + std::to_string(i), actual[i], "In order");
        }
    }
};

class NoSinksTest : public TestCase {
public:
    NoSinksTest() : TestCase("A dispatcher without sinks accepts and drops events") {}

protected:
    void runTest() override {
        TrackDispatcher dispatcher({}, DebugChannel("writer", "test"));
        ASSERT_EQUALS(0u, dispatcher.writerCount(), "No sinks");
        ASSERT_TRUE(dispatcher.post(TrackInfo(0, 0.0, "x")), "Accepted");
        dispatcher.finish();
        dispatcher.finish();
    }
};

class RemoveArtifactsTest : public TestCase {
public:
    RemoveArtifactsTest() : TestCase("removeArtifacts() deletes sink files") {}

protected:
    void runTest() override {
        TempDirectory dir;
        std::vector<std::unique_ptr<TrackWriter>> writers;
        writers.push_back(std::make_unique<TrackListWriter>(dir.file("a.txt"), DebugChannel("writer", "test")));
        writers.push_back(std::make_unique<TrackListWriter>(dir.file("b.txt"), DebugChannel("writer", "test")));

        TrackDispatcher dispatcher(std::move(writers), DebugChannel("writer", "test"));
        dispatcher.post(TrackInfo(0, 0.0, "x"));
        dispatcher.finish();
        ASSERT_EQUALS(2u, dir.listFiles().size(), "Both files written");

        dispatcher.removeArtifacts();
        ASSERT_EQUALS(0u, dir.listFiles().size(), "Both files removed");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Track Dispatcher Tests");

    suite.addTest(std::make_unique<DispatchOrderTest>());
    suite.addTest(std::make_unique<FailingSinkIsolationTest>());
    suite.addTest(std::make_unique<BackpressureTest>());
    suite.addTest(std::make_unique<NoSinksTest>());
    suite.addTest(std::make_unique<RemoveArtifactsTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
