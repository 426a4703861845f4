#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/issue_record.hpp"
#include "core/scan_limits.hpp"
#include "core/tree_walker.hpp"
#include "core/volume_inspector.hpp"

class IssueCollector;

struct ScanSummary
{
    size_t total_files = 0;      // every regular file found, unreadable ones included
    size_t files_discovered = 0; // files handed to the workers
    size_t files_processed = 0;
    size_t files_failed = 0;  // processed, but ended with a read error
    size_t files_skipped = 0; // never started because the scan was cancelled
    size_t audio_files = 0;
    size_t directories = 0;
    size_t worker_count = 0;
    bool cancelled = false;
    long long elapsed_ms = 0;

    std::map<std::string, size_t> files_by_extension; // lower case, "" for none
    std::map<IssueCategory, size_t> issues_by_category;
    size_t errors = 0;
    size_t warnings = 0;
    size_t infos = 0;
};

struct ScanReport
{
    VolumeProfile volume;
    std::vector<IssueRecord> issues; // report order
    ScanSummary summary;

    bool hasErrors() const { return summary.errors > 0; }
};

/**
 * @brief Runs a complete verification of one drive
 *
 * Volume inspection and the tree walk run sequentially on the calling
 * thread; the per-file audio analysis fans out over a fixed-size worker pool
 * and all findings meet in one IssueCollector.
 */
class ScanCoordinator
{
public:
    // Produces the records of one file; may throw, the coordinator turns that into a read error
    using FileAnalyzer = std::function<std::vector<IssueRecord>(const FileNode &node)>;

    ScanCoordinator(const ScanLimits &limits, std::unique_ptr<VolumeInfoProvider> provider);

    /**
     * @brief Verify the tree under `root` on the volume mounted at `mount_path`
     * @param worker_count Number of workers, 0 for the default
     * @throws ScanError if the root is not a readable directory
     */
    ScanReport scan(const std::string &root, const std::string &mount_path, size_t worker_count = 0);

    // Stop starting new files; files in progress finish and are reported completely.
    // Safe from any thread. A cancel before scan() leaves every file unanalyzed.
    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    void setFileAnalyzer(FileAnalyzer analyzer);

    // Live progress, safe to read from another thread during scan()
    size_t getProcessedCount() const { return processed_.load(); }

private:
    void processFile(const FileNode &node, IssueCollector &collector);

    ScanLimits limits_;
    VolumeInspector inspector_;
    FileAnalyzer analyzer_;

    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> processed_{0};
    std::atomic<size_t> failed_{0};
    size_t total_to_process_ = 0;
};
