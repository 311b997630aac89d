#include <gtest/gtest.h>

#include "daemon/control_inbox.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace loom::daemon;

TEST(ControlInbox, InitiallyEmpty)
{
    ControlInbox inbox;
    EXPECT_TRUE(inbox.empty());
    EXPECT_EQ(inbox.drain(), 0u);
}

TEST(ControlInbox, DrainRunsInPostOrder)
{
    ControlInbox     inbox;
    std::vector<int> order;

    inbox.post([&order] { order.push_back(1); });
    inbox.post([&order] { order.push_back(2); });
    inbox.post([&order] { order.push_back(3); });
    EXPECT_EQ(inbox.size(), 3u);

    EXPECT_EQ(inbox.drain(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(inbox.empty());
}

TEST(ControlInbox, TaskPostedWhileDrainingRunsNextTime)
{
    ControlInbox inbox;
    int          runs = 0;

    inbox.post(
        [&]
        {
            ++runs;
            inbox.post([&runs] { ++runs; });
        });

    EXPECT_EQ(inbox.drain(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(inbox.drain(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(ControlInbox, WaitTimesOutWhenIdle)
{
    ControlInbox inbox;
    auto         start = std::chrono::steady_clock::now();
    EXPECT_EQ(inbox.wait_and_drain(std::chrono::milliseconds(20)), 0u);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(15));
}

TEST(ControlInbox, PostWakesWaiter)
{
    ControlInbox inbox;
    std::atomic<bool> ran{false};

    std::thread producer(
        [&]
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            inbox.post([&ran] { ran = true; });
        });

    auto start = std::chrono::steady_clock::now();
    size_t n   = 0;
    while (n == 0 && std::chrono::steady_clock::now() - start < std::chrono::seconds(5))
        n = inbox.wait_and_drain(std::chrono::milliseconds(1000));
    producer.join();

    EXPECT_EQ(n, 1u);
    EXPECT_TRUE(ran.load());
}

TEST(ControlInbox, ManyProducers)
{
    ControlInbox     inbox;
    std::atomic<int> total{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&]
            {
                for (int i = 0; i < 250; ++i)
                    inbox.post([&total] { ++total; });
            });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_EQ(inbox.drain(), 1000u);
    EXPECT_EQ(total.load(), 1000);
}
