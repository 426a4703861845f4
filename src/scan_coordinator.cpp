#include "core/scan_coordinator.hpp"
#include "core/audio_compliance.hpp"
#include "core/audio_probe.hpp"
#include "core/file_utils.hpp"
#include "core/issue_collector.hpp"
#include "core/scan_error.hpp"
#include "core/scan_worker_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>

ScanCoordinator::ScanCoordinator(const ScanLimits &limits, std::unique_ptr<VolumeInfoProvider> provider)
    : limits_(limits), inspector_(std::move(provider), limits.recommended_cluster_size)
{
    // Default per-file stage: audio probe plus the audio rules
    ScanLimits probe_limits = limits_;
    analyzer_ = [probe_limits](const FileNode &node)
    {
        AudioProbe probe(probe_limits);
        AudioProbeResult result = probe.analyze(node.path);
        if (result.failure)
        {
            Logger::warn("Could not analyze " + node.relative_path + ": " +
                         AudioCompliance::describeFailure(*result.failure));
        }
        return AudioCompliance::evaluate(node.relative_path, result, probe_limits);
    };
}

void ScanCoordinator::cancel()
{
    if (!cancelled_.exchange(true))
    {
        Logger::info("Scan cancelled, finishing files in progress");
    }
}

void ScanCoordinator::setFileAnalyzer(FileAnalyzer analyzer)
{
    analyzer_ = std::move(analyzer);
}

ScanReport ScanCoordinator::scan(const std::string &root, const std::string &mount_path, size_t worker_count)
{
    auto start_time = std::chrono::steady_clock::now();

    std::string error_message;
    if (!FileUtils::isReadableDirectory(root, error_message))
    {
        Logger::error("Cannot scan " + root + ": " + error_message);
        throw ScanError(error_message);
    }

    processed_.store(0);
    failed_.store(0);

    ScanReport report;
    ScanSummary &summary = report.summary;
    IssueCollector collector;

    // Sequential phase
    VolumeInspection volume = inspector_.inspect(mount_path.empty() ? root : mount_path);
    report.volume = volume.profile;
    collector.submitAll(std::move(volume.issues));

    TreeWalker walker(limits_);
    WalkResult walk = walker.walk(root);
    collector.submitAll(std::move(walk.issues));

    const std::vector<FileNode> &files = walk.files;
    summary.total_files = walk.stats.total_files;
    summary.directories = walk.stats.directories;
    summary.files_discovered = files.size();
    for (const auto &node : files)
    {
        std::string extension = FileUtils::getFileExtension(node.path);
        ++summary.files_by_extension[extension];
        if (AudioProbe::containerForExtension(extension) != ContainerFormat::Unknown)
            ++summary.audio_files;
    }

    // Parallel phase
    size_t workers = worker_count == 0 ? ScanWorkerPool::defaultWorkerCount()
                                       : ScanWorkerPool::resolveWorkerCount(static_cast<int>(std::min<size_t>(worker_count, ScanWorkerPool::MAX_WORKERS)));
    summary.worker_count = workers;
    total_to_process_ = files.size();

    Logger::info("Analyzing " + std::to_string(files.size()) + " files (" + std::to_string(summary.audio_files) +
                 " audio) with " + std::to_string(workers) + " workers");

    size_t started = 0;
    {
        ScanWorkerPool pool(workers);
        started = pool.run(
            files.size(),
            [&](size_t index)
            { processFile(files[index], collector); },
            [this]
            { return cancelled_.load(); });
    }

    summary.files_processed = processed_.load();
    summary.files_failed = failed_.load();
    summary.files_skipped = files.size() - started;
    summary.cancelled = summary.files_skipped > 0 || cancelled_.load();
    if (summary.files_skipped > 0)
    {
        Logger::warn("Scan cancelled: " + std::to_string(summary.files_skipped) + " files were not analyzed");
    }

    // Fan-in
    report.issues = collector.finalize();
    summary.issues_by_category = collector.counts();
    summary.errors = collector.count(IssueSeverity::Error);
    summary.warnings = collector.count(IssueSeverity::Warning);
    summary.infos = collector.count(IssueSeverity::Info);

    summary.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start_time)
                             .count();

    Logger::info("Scan finished in " + std::to_string(summary.elapsed_ms) + " ms: " +
                 std::to_string(summary.files_processed) + " files processed, " +
                 std::to_string(summary.files_failed) + " failed, " + std::to_string(summary.errors) + " errors, " +
                 std::to_string(summary.warnings) + " warnings");
    return report;
}

void ScanCoordinator::processFile(const FileNode &node, IssueCollector &collector)
{
    std::vector<IssueRecord> records;
    try
    {
        records = analyzer_(node);
    }
    catch (const std::exception &e)
    {
        Logger::error("Error analyzing " + node.relative_path + ": " + std::string(e.what()));
        records.clear();
        records.emplace_back(node.relative_path, IssueCategory::ReadError, IssueSeverity::Warning,
                             "Analysis failed: " + std::string(e.what()));
    }

    bool failed = std::any_of(records.begin(), records.end(),
                              [](const IssueRecord &record)
                              { return record.category == IssueCategory::ReadError; });
    if (failed)
        failed_.fetch_add(1);

    // One batch per file: the collector holds all of a file's records or none
    collector.submitAll(std::move(records));

    size_t done = processed_.fetch_add(1) + 1;
    if (done % 1000 == 0)
    {
        Logger::info("Processed " + std::to_string(done) + "/" + std::to_string(total_to_process_) + " files");
    }
}
