#pragma once

#include <array>
#include <string>
#include <utility>

/**
 * @brief Kind of compatibility violation.
 *
 * Declaration order is the secondary sort key of the final report.
 */
enum class IssueCategory
{
    FilesystemType,
    PartitionScheme,
    ClusterSize,
    TotalFileCount,
    RootFolderCount,
    FilesPerFolder,
    NestingDepth,
    PathLength,
    FilenameLength,
    InvalidCharacters,
    UnsupportedFormat,
    EncodingMode,
    Bitrate,
    SampleRate,
    TagVersion,
    AlbumArtSize,
    ReadError
};

enum class IssueSeverity
{
    Error,
    Warning,
    Info
};

/**
 * @brief One compatibility finding. Immutable once created.
 *
 * Volume-level and tree-level findings carry an empty path; everything else
 * carries the path relative to the scan root.
 */
struct IssueRecord
{
    std::string path;
    IssueCategory category;
    IssueSeverity severity;
    std::string description;

    IssueRecord(std::string p, IssueCategory c, IssueSeverity s, std::string d)
        : path(std::move(p)), category(c), severity(s), description(std::move(d)) {}

    bool operator==(const IssueRecord &other) const;
    bool operator!=(const IssueRecord &other) const { return !(*this == other); }

    // Report order: path, category, severity, description
    bool operator<(const IssueRecord &other) const;
};

class IssueCategories
{
public:
    static constexpr size_t COUNT = static_cast<size_t>(IssueCategory::ReadError) + 1;

    static const std::array<IssueCategory, COUNT> &all();

    /**
     * @brief Name used in the issue_type column of the CSV report
     *
     * Remediation tools key off these strings, they must not change.
     */
    static std::string getDisplayName(IssueCategory category);

    static std::string getSeverityName(IssueSeverity severity);

    static size_t index(IssueCategory category) { return static_cast<size_t>(category); }
};
