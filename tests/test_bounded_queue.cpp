/*
 * test_bounded_queue.cpp - BoundedQueue tests
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"
#include "test_framework.h"

using namespace TestFramework;

class FifoOrderTest : public TestCase {
public:
    FifoOrderTest() : TestCase("Items come out in push order") {}

protected:
    void runTest() override {
        BoundedQueue<std::string> queue(3);
        ASSERT_FALSE(queue.isClosed(), "New queue open");

        ASSERT_TRUE(queue.push("one"), "First");
        ASSERT_TRUE(queue.push("two"), "Second");
        ASSERT_TRUE(queue.push("three"), "Third");

        std::string item;
        ASSERT_TRUE(queue.pop(item), "Pop");
        ASSERT_EQUALS(std::string("one"), item, "Oldest first");
        ASSERT_TRUE(queue.push("four"), "Room again after a pop");
        ASSERT_TRUE(queue.pop(item), "Pop");
        ASSERT_EQUALS(std::string("two"), item, "Second oldest");
        ASSERT_TRUE(queue.pop(item), "Pop");
        ASSERT_EQUALS(std::string("three"), item, "Third oldest");
        ASSERT_TRUE(queue.pop(item), "Pop");
        ASSERT_EQUALS(std::string("four"), item, "Newest last");
    }
};

class CloseTest : public TestCase {
public:
    CloseTest() : TestCase("close() refuses pushes and drains pops") {}

protected:
    void runTest() override {
        BoundedQueue<int> queue;
        ASSERT_TRUE(queue.push(1), "Push");
        ASSERT_TRUE(queue.push(2), "Push");
        queue.close();
        ASSERT_TRUE(queue.isClosed(), "Closed");
        ASSERT_FALSE(queue.push(3), "Push refused");

        int item = 0;
        ASSERT_TRUE(queue.pop(item) && item == 1, "Remaining item");
        ASSERT_TRUE(queue.pop(item) && item == 2, "Remaining item");
        ASSERT_FALSE(queue.pop(item), "Drained");
    }
};

class BlockingTest : public TestCase {
public:
    BlockingTest() : TestCase("Producer waits while full, consumer wakes on close") {}

protected:
    void runTest() override {
        BoundedQueue<int> queue(1);
        ASSERT_TRUE(queue.push(1), "Fill");

        std::atomic<bool> pushed{false};
        std::thread producer([&]() {
            queue.push(2);
            pushed = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bool pushed_while_full = pushed.load();

        int item = 0;
        bool popped = queue.pop(item);
        producer.join();
        ASSERT_FALSE(pushed_while_full, "Producer blocked while full");
        ASSERT_TRUE(popped, "Pop makes room");
        ASSERT_TRUE(pushed.load(), "Producer resumed");
        ASSERT_TRUE(queue.pop(item) && item == 2, "Second item");

        std::atomic<bool> consumer_result{true};
        std::thread consumer([&]() {
            int value = 0;
            consumer_result = queue.pop(value);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.close();
        consumer.join();
        ASSERT_FALSE(consumer_result.load(), "Waiting consumer released by close()");
    }
};

class ProducerConsumerTest : public TestCase {
public:
    ProducerConsumerTest() : TestCase("One producer, one consumer, small capacity") {}

protected:
    void runTest() override {
        const int count = 1000;
        BoundedQueue<int> queue(4);
        std::vector<int> received;

        std::thread consumer([&]() {
            int value = 0;
            while (queue.pop(value)) {
                received.push_back(value);
            }
        });
        for (int i = 0; i < count; ++i) {
            queue.push(int(i));
        }
        queue.close();
        consumer.join();

        ASSERT_EQUALS(static_cast<size_t>(count), received.size(), "Everything delivered");
        for (int i = 0; i < count; ++i) {
            ASSERT_EQUALS(i, received[i], "In order");
        }
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("BoundedQueue Tests");

    suite.addTest(std::make_unique<FifoOrderTest>());
    suite.addTest(std::make_unique<CloseTest>());
    suite.addTest(std::make_unique<BlockingTest>());
    suite.addTest(std::make_unique<ProducerConsumerTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
