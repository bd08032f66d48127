#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "sandbox/response_queue.hpp"

namespace {

using namespace std::chrono_literals;
using rlm::sandbox::ResponseQueue;

TEST(ResponseQueueTest, PopsInArrivalOrder) {
    ResponseQueue queue;
    queue.Push("one");
    queue.Push("two");
    std::string line;
    ASSERT_TRUE(queue.TryPop(line, 10ms));
    EXPECT_EQ(line, "one");
    ASSERT_TRUE(queue.TryPop(line, 10ms));
    EXPECT_EQ(line, "two");
    EXPECT_EQ(queue.Size(), 0u);
}

TEST(ResponseQueueTest, TimesOutWhenEmpty) {
    ResponseQueue queue;
    std::string line;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.TryPop(line, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
    EXPECT_FALSE(queue.Closed());
}

TEST(ResponseQueueTest, WakesWaiterOnPush) {
    ResponseQueue queue;
    std::thread producer([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.Push("late");
    });
    std::string line;
    EXPECT_TRUE(queue.TryPop(line, 5s));
    EXPECT_EQ(line, "late");
    producer.join();
}

TEST(ResponseQueueTest, CloseWakesWaiterAndDrainsRemaining) {
    ResponseQueue queue;
    queue.Push("last");
    queue.Close();
    std::string line;
    EXPECT_TRUE(queue.TryPop(line, 10ms));
    EXPECT_EQ(line, "last");

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.TryPop(line, 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_TRUE(queue.Closed());
}

TEST(ResponseQueueTest, ReopenClearsState) {
    ResponseQueue queue;
    queue.Push("stale");
    queue.Close();
    queue.Reopen();
    EXPECT_FALSE(queue.Closed());
    EXPECT_EQ(queue.Size(), 0u);
}

}  // namespace
