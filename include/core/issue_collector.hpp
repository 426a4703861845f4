#pragma once

#include <tbb/enumerable_thread_specific.h>
#include <array>
#include <atomic>
#include <map>
#include <mutex>
#include <vector>
#include "core/issue_record.hpp"

/**
 * @brief Thread-safe accumulation of issue records from concurrent workers
 *
 * Each submitting thread appends to its own local buffer, so submission never
 * contends on a shared lock. Buffers are merged and sorted once, in finalize().
 * Per-category and per-severity tallies are atomic and may be read at any time
 * for progress reporting.
 */
class IssueCollector
{
public:
    IssueCollector();
    ~IssueCollector() = default;

    IssueCollector(const IssueCollector &) = delete;
    IssueCollector &operator=(const IssueCollector &) = delete;

    // Callable concurrently from any thread
    void submit(IssueRecord record);
    void submitAll(std::vector<IssueRecord> records);

    /**
     * @brief Merge all buffers and return the records in report order
     *
     * Must be called exactly once, after every submitter has finished.
     * @throws std::logic_error on a second call
     */
    std::vector<IssueRecord> finalize();

    std::map<IssueCategory, size_t> counts() const;
    size_t count(IssueCategory category) const;
    size_t count(IssueSeverity severity) const;
    size_t total() const { return total_.load(); }

    bool isFinalized() const { return finalized_.load(); }

private:
    void tally(const IssueRecord &record);

    tbb::enumerable_thread_specific<std::vector<IssueRecord>> local_buffers_;

    std::array<std::atomic<size_t>, IssueCategories::COUNT> category_counts_;
    std::array<std::atomic<size_t>, 3> severity_counts_;
    std::atomic<size_t> total_{0};

    std::atomic<bool> finalized_{false};
    std::mutex finalize_mutex_;
};
