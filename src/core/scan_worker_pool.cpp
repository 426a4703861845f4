#include "core/scan_worker_pool.hpp"
#include <algorithm>
#include <thread>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>

namespace
{
    size_t clampWorkers(size_t num_workers)
    {
        return std::min(std::max(num_workers, ScanWorkerPool::MIN_WORKERS), ScanWorkerPool::MAX_WORKERS);
    }
}

ScanWorkerPool::ScanWorkerPool(size_t num_workers)
    : num_workers_(validateWorkerCount(num_workers) ? num_workers : clampWorkers(num_workers)),
      parallelism_(tbb::global_control::max_allowed_parallelism, num_workers_),
      arena_(static_cast<int>(num_workers_))
{
    if (num_workers_ != num_workers)
    {
        Logger::error("Invalid worker count: " + std::to_string(num_workers) + ". Using " +
                      std::to_string(num_workers_));
    }
    Logger::debug("Scan worker pool created with " + std::to_string(num_workers_) + " workers");
}

size_t ScanWorkerPool::run(size_t count, const std::function<void(size_t)> &task,
                           const std::function<bool()> &should_stop)
{
    std::atomic<size_t> started{0};
    if (count == 0)
        return 0;

    // Grain size 1 with the simple partitioner: every file is its own task,
    // so idle workers steal single files rather than whole ranges
    arena_.execute(
        [&]
        {
            tbb::parallel_for(
                tbb::blocked_range<size_t>(0, count, 1),
                [&](const tbb::blocked_range<size_t> &range)
                {
                    for (size_t i = range.begin(); i != range.end(); ++i)
                    {
                        if (should_stop && should_stop())
                            return;
                        started.fetch_add(1);
                        task(i);
                    }
                },
                tbb::simple_partitioner());
        });

    return started.load();
}

size_t ScanWorkerPool::defaultWorkerCount()
{
    size_t hardware_concurrency = std::thread::hardware_concurrency();
    if (hardware_concurrency == 0)
        hardware_concurrency = 1;
    return clampWorkers(hardware_concurrency * 2);
}

size_t ScanWorkerPool::resolveWorkerCount(int requested)
{
    if (requested <= 0)
        return defaultWorkerCount();
    return clampWorkers(static_cast<size_t>(requested));
}

bool ScanWorkerPool::validateWorkerCount(size_t num_workers)
{
    if (num_workers < MIN_WORKERS || num_workers > MAX_WORKERS)
    {
        Logger::warn("Worker count " + std::to_string(num_workers) + " is outside valid range [" +
                     std::to_string(MIN_WORKERS) + ", " + std::to_string(MAX_WORKERS) + "]");
        return false;
    }

    size_t hardware_concurrency = std::thread::hardware_concurrency();
    if (hardware_concurrency > 0 && num_workers > hardware_concurrency * 4)
    {
        Logger::debug("Worker count " + std::to_string(num_workers) + " is well above hardware concurrency (" +
                      std::to_string(hardware_concurrency) + ")");
    }

    return true;
}
