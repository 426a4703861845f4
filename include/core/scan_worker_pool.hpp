#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include "logging/logger.hpp"

/**
 * @brief Fixed-size pool that runs one task per work item
 *
 * Backed by a TBB task arena of the worker count. The pool also raises TBB's
 * global parallelism limit to that count while it exists, so more workers than
 * cores really run. Each item index is claimed by exactly one worker. The size
 * is fixed for the lifetime of the pool.
 */
class ScanWorkerPool
{
public:
    explicit ScanWorkerPool(size_t num_workers);
    ~ScanWorkerPool() = default;

    ScanWorkerPool(const ScanWorkerPool &) = delete;
    ScanWorkerPool &operator=(const ScanWorkerPool &) = delete;

    /**
     * @brief Run `task(i)` for every i in [0, count)
     *
     * Once `should_stop` returns true no further index is started; indices
     * already started run to completion. `task` must not throw.
     * @return Number of indices started
     */
    size_t run(size_t count, const std::function<void(size_t)> &task,
               const std::function<bool()> &should_stop = nullptr);

    size_t getWorkerCount() const { return num_workers_; }

    // Twice the hardware parallelism, clamped to the valid range
    static size_t defaultWorkerCount();

    // 0 (or negative) selects the default, anything else is clamped
    static size_t resolveWorkerCount(int requested);

    static bool validateWorkerCount(size_t num_workers);

    static constexpr size_t MIN_WORKERS = 1;
    static constexpr size_t MAX_WORKERS = 256;

private:
    size_t num_workers_;
    tbb::global_control parallelism_;
    tbb::task_arena arena_;
};
