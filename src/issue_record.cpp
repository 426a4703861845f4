#include "core/issue_record.hpp"
#include <tuple>

bool IssueRecord::operator==(const IssueRecord &other) const
{
    return path == other.path && category == other.category &&
           severity == other.severity && description == other.description;
}

bool IssueRecord::operator<(const IssueRecord &other) const
{
    return std::tie(path, category, severity, description) <
           std::tie(other.path, other.category, other.severity, other.description);
}

const std::array<IssueCategory, IssueCategories::COUNT> &IssueCategories::all()
{
    static const std::array<IssueCategory, COUNT> categories = {
        IssueCategory::FilesystemType,
        IssueCategory::PartitionScheme,
        IssueCategory::ClusterSize,
        IssueCategory::TotalFileCount,
        IssueCategory::RootFolderCount,
        IssueCategory::FilesPerFolder,
        IssueCategory::NestingDepth,
        IssueCategory::PathLength,
        IssueCategory::FilenameLength,
        IssueCategory::InvalidCharacters,
        IssueCategory::UnsupportedFormat,
        IssueCategory::EncodingMode,
        IssueCategory::Bitrate,
        IssueCategory::SampleRate,
        IssueCategory::TagVersion,
        IssueCategory::AlbumArtSize,
        IssueCategory::ReadError};
    return categories;
}

std::string IssueCategories::getDisplayName(IssueCategory category)
{
    switch (category)
    {
    case IssueCategory::FilesystemType:
        return "Filesystem Type";
    case IssueCategory::PartitionScheme:
        return "Partition Scheme";
    case IssueCategory::ClusterSize:
        return "Cluster Size";
    case IssueCategory::TotalFileCount:
        return "Total File Count";
    case IssueCategory::RootFolderCount:
        return "Root Folder Count";
    case IssueCategory::FilesPerFolder:
        return "Files Per Folder";
    case IssueCategory::NestingDepth:
        return "Nesting Depth";
    case IssueCategory::PathLength:
        return "Path Length";
    case IssueCategory::FilenameLength:
        return "Filename Length";
    case IssueCategory::InvalidCharacters:
        return "Invalid Characters";
    case IssueCategory::UnsupportedFormat:
        return "Unsupported Formats";
    case IssueCategory::EncodingMode:
        return "Encoding";
    case IssueCategory::Bitrate:
        return "Bitrate";
    case IssueCategory::SampleRate:
        return "Sample Rate";
    case IssueCategory::TagVersion:
        return "ID3 Tags";
    case IssueCategory::AlbumArtSize:
        return "Album Art";
    case IssueCategory::ReadError:
        return "Read Error";
    default:
        return "Unknown";
    }
}

std::string IssueCategories::getSeverityName(IssueSeverity severity)
{
    switch (severity)
    {
    case IssueSeverity::Error:
        return "ERROR";
    case IssueSeverity::Warning:
        return "WARNING";
    case IssueSeverity::Info:
        return "INFO";
    default:
        return "UNKNOWN";
    }
}
