#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "core/scan_worker_pool.hpp"

TEST(ScanWorkerPoolTest, EveryIndexRunsExactlyOnce)
{
    ScanWorkerPool pool(8);
    const size_t count = 5000;
    std::vector<std::atomic<int>> hits(count);
    for (auto &h : hits)
        h.store(0);

    size_t started = pool.run(count, [&hits](size_t i)
                              { hits[i].fetch_add(1); });

    EXPECT_EQ(started, count);
    for (size_t i = 0; i < count; ++i)
        ASSERT_EQ(hits[i].load(), 1) << "index " << i;
}

namespace
{
    // Runs `count` tasks that each wait until `target` tasks are active at once
    // (or a timeout passes) and returns the highest number seen together
    size_t peakConcurrency(size_t workers, size_t count, size_t target)
    {
        ScanWorkerPool pool(workers);
        std::atomic<size_t> active{0};
        std::atomic<size_t> peak{0};

        pool.run(count, [&](size_t)
                 {
            size_t now = active.fetch_add(1) + 1;
            size_t seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }

            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (peak.load() < target && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            active.fetch_sub(1); });

        return peak.load();
    }
}

TEST(ScanWorkerPoolTest, RunsAsManyWorkersAsRequested)
{
    // Also holds on machines with fewer cores than workers
    EXPECT_EQ(peakConcurrency(4, 16, 4), 4u);
    EXPECT_EQ(peakConcurrency(8, 32, 8), 8u);
}

TEST(ScanWorkerPoolTest, FewerItemsThanWorkers)
{
    EXPECT_EQ(peakConcurrency(8, 3, 3), 3u);
}

TEST(ScanWorkerPoolTest, SingleWorkerNeverOverlaps)
{
    EXPECT_EQ(peakConcurrency(1, 6, 1), 1u);
}

TEST(ScanWorkerPoolTest, EmptyRun)
{
    ScanWorkerPool pool(4);
    bool called = false;
    EXPECT_EQ(pool.run(0, [&called](size_t)
                       { called = true; }),
              0u);
    EXPECT_FALSE(called);
}

TEST(ScanWorkerPoolTest, SingleWorkerUsesOneThread)
{
    ScanWorkerPool pool(1);
    std::mutex mutex;
    std::set<std::thread::id> threads;

    pool.run(200, [&](size_t)
             {
        std::lock_guard<std::mutex> lock(mutex);
        threads.insert(std::this_thread::get_id()); });

    EXPECT_EQ(threads.size(), 1u);
}

TEST(ScanWorkerPoolTest, StopsStartingNewIndices)
{
    ScanWorkerPool pool(4);
    std::atomic<size_t> executed{0};
    std::atomic<bool> stop{false};

    size_t started = pool.run(
        10000,
        [&](size_t)
        {
            if (executed.fetch_add(1) + 1 >= 100)
                stop.store(true);
        },
        [&stop]()
        { return stop.load(); });

    // Everything started also finished
    EXPECT_EQ(started, executed.load());
    EXPECT_GE(started, 100u);
    EXPECT_LT(started, 10000u);
}

TEST(ScanWorkerPoolTest, StopBeforeStartRunsNothing)
{
    ScanWorkerPool pool(4);
    std::atomic<size_t> executed{0};
    size_t started = pool.run(
        50, [&executed](size_t)
        { executed.fetch_add(1); },
        []()
        { return true; });

    EXPECT_EQ(started, 0u);
    EXPECT_EQ(executed.load(), 0u);
}

TEST(ScanWorkerPoolTest, WorkerCountIsClamped)
{
    EXPECT_EQ(ScanWorkerPool(0).getWorkerCount(), ScanWorkerPool::MIN_WORKERS);
    EXPECT_EQ(ScanWorkerPool(1000).getWorkerCount(), ScanWorkerPool::MAX_WORKERS);
    EXPECT_EQ(ScanWorkerPool(16).getWorkerCount(), 16u);
}

TEST(ScanWorkerPoolTest, ResolveWorkerCount)
{
    size_t default_count = ScanWorkerPool::defaultWorkerCount();
    EXPECT_GE(default_count, ScanWorkerPool::MIN_WORKERS);
    EXPECT_LE(default_count, ScanWorkerPool::MAX_WORKERS);

    size_t hardware = std::thread::hardware_concurrency();
    if (hardware > 0 && hardware * 2 <= ScanWorkerPool::MAX_WORKERS)
        EXPECT_EQ(default_count, hardware * 2);

    EXPECT_EQ(ScanWorkerPool::resolveWorkerCount(0), default_count);
    EXPECT_EQ(ScanWorkerPool::resolveWorkerCount(-3), default_count);
    EXPECT_EQ(ScanWorkerPool::resolveWorkerCount(3), 3u);
    EXPECT_EQ(ScanWorkerPool::resolveWorkerCount(100000), ScanWorkerPool::MAX_WORKERS);
}

TEST(ScanWorkerPoolTest, ValidateWorkerCount)
{
    EXPECT_FALSE(ScanWorkerPool::validateWorkerCount(0));
    EXPECT_TRUE(ScanWorkerPool::validateWorkerCount(1));
    EXPECT_TRUE(ScanWorkerPool::validateWorkerCount(256));
    EXPECT_FALSE(ScanWorkerPool::validateWorkerCount(257));
}
