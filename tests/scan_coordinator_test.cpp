#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <memory>
#include <stdexcept>
#include "audio_fixtures.hpp"
#include "core/scan_coordinator.hpp"
#include "core/scan_error.hpp"
#include "core/shutdown_manager.hpp"
#include "test_base.hpp"

namespace
{
    class FixedVolumeInfoProvider : public VolumeInfoProvider
    {
    public:
        explicit FixedVolumeInfoProvider(std::string filesystem) : filesystem_(std::move(filesystem)) {}

        VolumeFacts query(const std::string &) override
        {
            VolumeFacts facts;
            facts.filesystem_name = filesystem_;
            facts.partition_table = "dos";
            facts.cluster_size_bytes = 32768;
            return facts;
        }
        std::string name() const override { return "fixed"; }

    private:
        std::string filesystem_;
    };

    size_t countCategory(const std::vector<IssueRecord> &issues, IssueCategory category)
    {
        return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                                 [category](const IssueRecord &issue)
                                                 { return issue.category == category; }));
    }
}

class ScanCoordinatorTest : public TestBase
{
protected:
    using Bytes = AudioFixtures::Bytes;

    std::unique_ptr<ScanCoordinator> makeCoordinator(const std::string &filesystem = "vfat")
    {
        return std::make_unique<ScanCoordinator>(limits_, std::make_unique<FixedVolumeInfoProvider>(filesystem));
    }

    ScanReport scan(size_t workers, const std::string &filesystem = "vfat")
    {
        return makeCoordinator(filesystem)->scan(getTestRoot(), getTestRoot(), workers);
    }

    static Bytes goodMp3() { return AudioFixtures::taggedMp3(3); }

    static Bytes corruptMp3()
    {
        std::string text(4096, 'x');
        return Bytes(text.begin(), text.end());
    }

    // A tree that produces records from every stage
    void createMixedTree()
    {
        createFile("Rock/01 clean.mp3", goodMp3());
        createFile("Rock/02 forbidden.mp3", AudioFixtures::repeat(AudioFixtures::frame144(), 40));
        createFile("Rock/03 broken.mp3", corruptMp3());
        createFile("Rock/04 lossless.flac", std::string("fLaC"));
        createFile("Jazz/cover.jpg", std::string("jpeg"));
        createFile("Jazz/Quartet?.mp3", goodMp3());
        createFile("Jazz/" + std::string(70, 'n') + ".mp3", goodMp3());
        createFile("Podcasts/episode.m4a", AudioFixtures::mp4File(44100));
        createFile("Podcasts/locked.wma", AudioFixtures::wmaFile(44100, 128, true));
        createFile("readme.txt", std::string("notes"));
    }

    ScanLimits limits_;
};

TEST_F(ScanCoordinatorTest, CleanDriveHasNoIssues)
{
    for (int i = 0; i < 5; ++i)
        createFile("Album/track" + std::to_string(i) + ".mp3", goodMp3());

    ScanReport report = scan(2);

    EXPECT_TRUE(report.issues.empty());
    EXPECT_FALSE(report.hasErrors());
    EXPECT_EQ(report.volume.filesystem, FilesystemType::FAT32);
    EXPECT_EQ(report.summary.total_files, 5u);
    EXPECT_EQ(report.summary.files_processed, 5u);
    EXPECT_EQ(report.summary.audio_files, 5u);
    EXPECT_EQ(report.summary.files_failed, 0u);
    EXPECT_EQ(report.summary.files_skipped, 0u);
    EXPECT_EQ(report.summary.worker_count, 2u);
    EXPECT_FALSE(report.summary.cancelled);
}

TEST_F(ScanCoordinatorTest, EveryStageContributes)
{
    createMixedTree();
    ScanReport report = scan(4, "ntfs");

    EXPECT_TRUE(report.hasErrors());
    EXPECT_EQ(countCategory(report.issues, IssueCategory::FilesystemType), 1u);
    EXPECT_EQ(countCategory(report.issues, IssueCategory::InvalidCharacters), 1u);
    EXPECT_EQ(countCategory(report.issues, IssueCategory::FilenameLength), 1u);
    EXPECT_EQ(countCategory(report.issues, IssueCategory::Bitrate), 1u);
    EXPECT_EQ(countCategory(report.issues, IssueCategory::UnsupportedFormat), 1u);
    EXPECT_EQ(countCategory(report.issues, IssueCategory::ReadError), 1u);

    EXPECT_EQ(report.summary.total_files, 10u);
    EXPECT_EQ(report.summary.files_processed, 10u);
    EXPECT_EQ(report.summary.audio_files, 8u);
    EXPECT_EQ(report.summary.files_failed, 1u);
    EXPECT_EQ(report.summary.files_by_extension.at("mp3"), 5u);
    EXPECT_EQ(report.summary.files_by_extension.at("jpg"), 1u);

    size_t errors = 0, warnings = 0, infos = 0;
    for (const auto &issue : report.issues)
    {
        if (issue.severity == IssueSeverity::Error)
            ++errors;
        else if (issue.severity == IssueSeverity::Warning)
            ++warnings;
        else
            ++infos;
    }
    EXPECT_EQ(report.summary.errors, errors);
    EXPECT_EQ(report.summary.warnings, warnings);
    EXPECT_EQ(report.summary.infos, infos);

    // Volume records sort first: empty path
    ASSERT_FALSE(report.issues.empty());
    EXPECT_EQ(report.issues.front().path, "");
    EXPECT_TRUE(std::is_sorted(report.issues.begin(), report.issues.end()));
}

TEST_F(ScanCoordinatorTest, WorkerCountDoesNotChangeReport)
{
    createMixedTree();
    for (int i = 0; i < 40; ++i)
        createFile("Bulk/file" + std::to_string(i) + ".mp3", i % 3 == 0 ? corruptMp3() : goodMp3());

    ScanReport single = scan(1);
    ScanReport four = scan(4);
    ScanReport many = scan(32);

    EXPECT_EQ(single.issues, four.issues);
    EXPECT_EQ(single.issues, many.issues);
    EXPECT_EQ(single.summary.issues_by_category, many.summary.issues_by_category);
    EXPECT_EQ(single.summary.files_failed, many.summary.files_failed);
}

TEST_F(ScanCoordinatorTest, CorruptFilesBecomeReadErrors)
{
    const int total = 20;
    const int corrupt = 5;
    for (int i = 0; i < total; ++i)
        createFile("Mix/t" + std::to_string(i) + ".mp3", i < corrupt ? corruptMp3() : goodMp3());

    ScanReport report = scan(8);

    EXPECT_EQ(report.summary.files_processed, static_cast<size_t>(total));
    EXPECT_EQ(report.summary.files_failed, static_cast<size_t>(corrupt));
    EXPECT_EQ(countCategory(report.issues, IssueCategory::ReadError), static_cast<size_t>(corrupt));
    for (const auto &issue : report.issues)
    {
        EXPECT_EQ(issue.severity, IssueSeverity::Warning);
        EXPECT_EQ(issue.description.rfind("Malformed audio header", 0), 0u) << issue.description;
    }
    EXPECT_FALSE(report.hasErrors());
}

TEST_F(ScanCoordinatorTest, ThrowingAnalyzerBecomesReadError)
{
    createFile("a.mp3", goodMp3());
    createFile("b.mp3", goodMp3());

    auto coordinator = makeCoordinator();
    coordinator->setFileAnalyzer(
        [](const FileNode &node) -> std::vector<IssueRecord>
        {
            if (node.relative_path == "b.mp3")
                throw std::runtime_error("decoder exploded");
            return {};
        });

    ScanReport report = coordinator->scan(getTestRoot(), getTestRoot(), 2);

    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].path, "b.mp3");
    EXPECT_EQ(report.issues[0].category, IssueCategory::ReadError);
    EXPECT_EQ(report.issues[0].severity, IssueSeverity::Warning);
    EXPECT_EQ(report.issues[0].description, "Analysis failed: decoder exploded");
    EXPECT_EQ(report.summary.files_processed, 2u);
    EXPECT_EQ(report.summary.files_failed, 1u);
}

TEST_F(ScanCoordinatorTest, CancelFinishesFilesInProgress)
{
    for (int i = 0; i < 50; ++i)
        createFile("Album/t" + std::to_string(i) + ".mp3", goodMp3());

    auto coordinator = makeCoordinator();
    ScanCoordinator *raw = coordinator.get();
    coordinator->setFileAnalyzer(
        [raw](const FileNode &node)
        {
            raw->cancel();
            // Two records per file: a cancelled scan still reports both
            return std::vector<IssueRecord>{
                IssueRecord(node.relative_path, IssueCategory::Bitrate, IssueSeverity::Warning, "first"),
                IssueRecord(node.relative_path, IssueCategory::SampleRate, IssueSeverity::Warning, "second")};
        });

    ScanReport report = coordinator->scan(getTestRoot(), getTestRoot(), 1);

    EXPECT_TRUE(coordinator->isCancelled());
    EXPECT_TRUE(report.summary.cancelled);
    EXPECT_EQ(report.summary.files_processed, 1u);
    EXPECT_EQ(report.summary.files_skipped, 49u);
    EXPECT_EQ(report.issues.size(), 2u);
}

TEST_F(ScanCoordinatorTest, CancelBeforeScanSkipsEveryFile)
{
    for (int i = 0; i < 10; ++i)
        createFile("Album/t" + std::to_string(i) + ".mp3", goodMp3());

    auto coordinator = makeCoordinator("ntfs");
    coordinator->cancel();
    ScanReport report = coordinator->scan(getTestRoot(), getTestRoot(), 4);

    EXPECT_EQ(report.summary.files_processed, 0u);
    EXPECT_EQ(report.summary.files_skipped, 10u);
    EXPECT_TRUE(report.summary.cancelled);
    // The sequential phase still ran
    EXPECT_EQ(countCategory(report.issues, IssueCategory::FilesystemType), 1u);
}

TEST_F(ScanCoordinatorTest, ProgressCounterMatchesSummary)
{
    for (int i = 0; i < 12; ++i)
        createFile("t" + std::to_string(i) + ".mp3", goodMp3());

    auto coordinator = makeCoordinator();
    ScanReport report = coordinator->scan(getTestRoot(), getTestRoot(), 3);
    EXPECT_EQ(coordinator->getProcessedCount(), report.summary.files_processed);
    EXPECT_EQ(coordinator->getProcessedCount(), 12u);
}

TEST_F(ScanCoordinatorTest, EmptyRoot)
{
    ScanReport report = scan(0);

    EXPECT_TRUE(report.issues.empty());
    EXPECT_EQ(report.summary.total_files, 0u);
    EXPECT_GE(report.summary.worker_count, 1u);
}

TEST_F(ScanCoordinatorTest, MissingRootThrows)
{
    auto coordinator = makeCoordinator();
    std::string missing = getTestRoot() + "/does_not_exist";
    EXPECT_THROW(coordinator->scan(missing, missing, 1), ScanError);
}

TEST_F(ScanCoordinatorTest, FileAsRootThrows)
{
    auto file = createFile("single.mp3", goodMp3());
    auto coordinator = makeCoordinator();
    EXPECT_THROW(coordinator->scan(file.string(), getTestRoot(), 1), ScanError);
}

TEST_F(ScanCoordinatorTest, ShutdownRequestCancelsScan)
{
    for (int i = 0; i < 30; ++i)
        createFile("Album/t" + std::to_string(i) + ".mp3", goodMp3());

    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.reset();

    auto coordinator = std::shared_ptr<ScanCoordinator>(makeCoordinator());
    std::weak_ptr<ScanCoordinator> cancel_target = coordinator;
    shutdown_manager.onShutdown([cancel_target]()
                                {
        if (auto target = cancel_target.lock())
            target->cancel(); });

    // The first analyzed file triggers the shutdown, as a signal would mid-scan
    coordinator->setFileAnalyzer([&shutdown_manager](const FileNode &)
                                 {
        shutdown_manager.requestShutdown("test-signal", SIGINT);
        return std::vector<IssueRecord>{}; });

    ScanReport report = coordinator->scan(getTestRoot(), getTestRoot(), 1);
    shutdown_manager.reset();

    EXPECT_TRUE(coordinator->isCancelled());
    EXPECT_TRUE(report.summary.cancelled);
    EXPECT_EQ(report.summary.files_processed, 1u);
    EXPECT_EQ(report.summary.files_skipped, 29u);
}
