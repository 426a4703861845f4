#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/issue_collector.hpp"

class IssueCollectorTest : public ::testing::Test
{
protected:
    static IssueRecord record(const std::string &path, IssueCategory category,
                              IssueSeverity severity = IssueSeverity::Warning, const std::string &description = "d")
    {
        return IssueRecord(path, category, severity, description);
    }
};

TEST_F(IssueCollectorTest, FinalizeSortsByPathThenCategory)
{
    IssueCollector collector;
    collector.submit(record("b/song.mp3", IssueCategory::TagVersion));
    collector.submit(record("a/song.mp3", IssueCategory::SampleRate));
    collector.submit(record("a/song.mp3", IssueCategory::EncodingMode));
    collector.submit(record("", IssueCategory::ClusterSize, IssueSeverity::Info));
    collector.submit(record("", IssueCategory::FilesystemType, IssueSeverity::Error));

    auto issues = collector.finalize();
    ASSERT_EQ(issues.size(), 5u);
    EXPECT_EQ(issues[0].category, IssueCategory::FilesystemType);
    EXPECT_EQ(issues[1].category, IssueCategory::ClusterSize);
    EXPECT_EQ(issues[2].path, "a/song.mp3");
    EXPECT_EQ(issues[2].category, IssueCategory::EncodingMode);
    EXPECT_EQ(issues[3].category, IssueCategory::SampleRate);
    EXPECT_EQ(issues[4].path, "b/song.mp3");
}

TEST_F(IssueCollectorTest, CountsAreAvailableBeforeFinalize)
{
    IssueCollector collector;
    collector.submit(record("x.mp3", IssueCategory::Bitrate, IssueSeverity::Error));
    collector.submitAll({record("y.mp3", IssueCategory::Bitrate, IssueSeverity::Error),
                         record("y.mp3", IssueCategory::TagVersion)});

    EXPECT_EQ(collector.total(), 3u);
    EXPECT_EQ(collector.count(IssueCategory::Bitrate), 2u);
    EXPECT_EQ(collector.count(IssueCategory::TagVersion), 1u);
    EXPECT_EQ(collector.count(IssueCategory::ReadError), 0u);
    EXPECT_EQ(collector.count(IssueSeverity::Error), 2u);
    EXPECT_EQ(collector.count(IssueSeverity::Warning), 1u);

    auto counts = collector.counts();
    EXPECT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[IssueCategory::Bitrate], 2u);
    EXPECT_FALSE(collector.isFinalized());
}

TEST_F(IssueCollectorTest, SecondFinalizeThrows)
{
    IssueCollector collector;
    collector.submit(record("x.mp3", IssueCategory::Bitrate));
    collector.finalize();
    EXPECT_TRUE(collector.isFinalized());
    EXPECT_THROW(collector.finalize(), std::logic_error);
    EXPECT_THROW(collector.submit(record("z.mp3", IssueCategory::Bitrate)), std::logic_error);
}

TEST_F(IssueCollectorTest, EmptyCollectorFinalizesToEmptyReport)
{
    IssueCollector collector;
    EXPECT_TRUE(collector.finalize().empty());
    EXPECT_TRUE(collector.counts().empty());
}

TEST_F(IssueCollectorTest, ConcurrentSubmissionsAreNeverLost)
{
    const int threads = 8;
    const int per_thread = 2000;

    IssueCollector collector;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back([&collector, t]()
                             {
            for (int i = 0; i < per_thread; ++i)
            {
                IssueCategory category = (i % 2 == 0) ? IssueCategory::Bitrate : IssueCategory::SampleRate;
                collector.submit(IssueRecord("t" + std::to_string(t) + "/f" + std::to_string(i), category,
                                             IssueSeverity::Warning, "x"));
            } });
    }
    for (auto &worker : workers)
    {
        worker.join();
    }

    EXPECT_EQ(collector.total(), static_cast<size_t>(threads * per_thread));
    auto issues = collector.finalize();
    ASSERT_EQ(issues.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_TRUE(std::is_sorted(issues.begin(), issues.end()));
    EXPECT_EQ(std::adjacent_find(issues.begin(), issues.end()), issues.end());
    EXPECT_EQ(collector.count(IssueCategory::Bitrate), static_cast<size_t>(threads * per_thread / 2));
}

TEST_F(IssueCollectorTest, DisplayNamesMatchReportColumn)
{
    EXPECT_EQ(IssueCategories::getDisplayName(IssueCategory::PathLength), "Path Length");
    EXPECT_EQ(IssueCategories::getDisplayName(IssueCategory::TagVersion), "ID3 Tags");
    EXPECT_EQ(IssueCategories::getDisplayName(IssueCategory::EncodingMode), "Encoding");
    EXPECT_EQ(IssueCategories::getDisplayName(IssueCategory::AlbumArtSize), "Album Art");
    EXPECT_EQ(IssueCategories::getDisplayName(IssueCategory::UnsupportedFormat), "Unsupported Formats");
    EXPECT_EQ(IssueCategories::getDisplayName(IssueCategory::ReadError), "Read Error");
    EXPECT_EQ(IssueCategories::getSeverityName(IssueSeverity::Error), "ERROR");
    EXPECT_EQ(IssueCategories::getSeverityName(IssueSeverity::Warning), "WARNING");
    EXPECT_EQ(IssueCategories::getSeverityName(IssueSeverity::Info), "INFO");
}
