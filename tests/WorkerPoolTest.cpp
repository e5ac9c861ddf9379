#include "WorkerPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

TEST(WorkerPool, RunsJobsAndReturnsResults)
{
    WorkerPool pool("test", 3, 8);
    EXPECT_EQ(pool.threadCount(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; i++)
        results.push_back(pool.submit([i]() { return i * i; }));
    for (int i = 0; i < 20; i++)
        EXPECT_EQ(results[i].get(), i * i);
}

TEST(WorkerPool, PropagatesExceptions)
{
    WorkerPool pool("test", 1, 1);
    auto f = pool.submit([]() -> std::string { throw std::runtime_error("backend exploded"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // The worker survives a throwing job
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPool, SubmitBlocksWhileQueueIsFull)
{
    WorkerPool pool("test", 1, 1);
    std::atomic<bool> release{false};
    std::atomic<bool> running{false};

    auto blocker = pool.submit([&]() {
        running = true;
        while (!release)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    while (!running)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    auto queued = pool.submit([]() { return 1; });
    EXPECT_EQ(pool.queued(), 1u);

    std::atomic<bool> thirdSubmitted{false};
    std::thread submitter([&]() {
        pool.submit([]() { return 2; }).get();
        thirdSubmitted = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(thirdSubmitted.load());

    release = true;
    submitter.join();
    EXPECT_TRUE(thirdSubmitted.load());
    EXPECT_EQ(queued.get(), 1);
    blocker.get();
}

TEST(WorkerPool, ShutdownDrainsQueueAndRejectsNewWork)
{
    WorkerPool pool("test", 2, 16);
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; i++)
    {
        futures.push_back(pool.submit([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            done++;
        }));
    }

    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_THROW(pool.submit([]() { return 0; }), std::runtime_error);

    pool.shutdown();
}
