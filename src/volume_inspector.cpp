#include "core/volume_inspector.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string withReason(const std::string &message, const std::string &note)
    {
        return note.empty() ? message : message + " (" + note + ")";
    }
}

VolumeInspector::VolumeInspector(std::unique_ptr<VolumeInfoProvider> provider, uint32_t recommended_cluster_size)
    : provider_(std::move(provider)), recommended_cluster_size_(recommended_cluster_size)
{
}

VolumeInspection VolumeInspector::inspect(const std::string &mount_path) const
{
    Logger::info("Inspecting volume at " + mount_path + " using " + provider_->name() + " provider");

    VolumeFacts facts = provider_->query(mount_path);
    VolumeInspection inspection;
    VolumeProfile &profile = inspection.profile;
    auto &issues = inspection.issues;

    // Filesystem
    if (facts.filesystem_name)
    {
        profile.filesystem_name = *facts.filesystem_name;
        profile.filesystem = normalizeFilesystem(*facts.filesystem_name);
    }

    if (profile.filesystem == FilesystemType::Unknown)
    {
        issues.emplace_back("", IssueCategory::FilesystemType, IssueSeverity::Info,
                            withReason("Filesystem type could not be determined", facts.filesystem_note));
    }
    else if (profile.filesystem != FilesystemType::FAT32)
    {
        issues.emplace_back("", IssueCategory::FilesystemType, IssueSeverity::Error,
                            "Filesystem is " + profile.filesystem_name + ", must be FAT32");
    }

    // Partition scheme
    if (facts.partition_table)
        profile.partition_scheme = normalizePartitionScheme(*facts.partition_table);

    if (profile.partition_scheme == PartitionScheme::GPT)
    {
        issues.emplace_back("", IssueCategory::PartitionScheme, IssueSeverity::Warning,
                            "Partition scheme is GPT, MBR recommended");
    }
    else if (profile.partition_scheme == PartitionScheme::Unknown)
    {
        std::string note = facts.partition_table ? "unrecognised scheme " + *facts.partition_table : facts.partition_note;
        issues.emplace_back("", IssueCategory::PartitionScheme, IssueSeverity::Info,
                            withReason("Partition scheme could not be determined", note));
    }

    // Cluster size
    profile.cluster_size_bytes = facts.cluster_size_bytes;
    if (!profile.cluster_size_bytes)
    {
        issues.emplace_back("", IssueCategory::ClusterSize, IssueSeverity::Info,
                            withReason("Cluster size could not be determined", facts.cluster_note));
    }
    else if (*profile.cluster_size_bytes != recommended_cluster_size_)
    {
        issues.emplace_back("", IssueCategory::ClusterSize, IssueSeverity::Info,
                            "Cluster size is " + std::to_string(*profile.cluster_size_bytes) +
                                " bytes, recommended " + std::to_string(recommended_cluster_size_) + " bytes (" +
                                std::to_string(recommended_cluster_size_ / 1024) + " KB)");
    }

    Logger::info("Volume: filesystem " + getFilesystemName(profile.filesystem) +
                 (profile.filesystem_name.empty() ? "" : " (" + profile.filesystem_name + ")") +
                 ", partition scheme " + getPartitionSchemeName(profile.partition_scheme) + ", cluster size " +
                 (profile.cluster_size_bytes ? std::to_string(*profile.cluster_size_bytes) : std::string("unknown")));

    return inspection;
}

FilesystemType VolumeInspector::normalizeFilesystem(const std::string &name)
{
    std::string value = toLower(name);
    if (value.empty())
        return FilesystemType::Unknown;
    if (value == "vfat" || value == "fat32" || value == "msdos" || value == "ms-dos fat32")
        return FilesystemType::FAT32;
    if (value == "ntfs" || value == "ntfs3")
        return FilesystemType::NTFS;
    if (value == "exfat")
        return FilesystemType::exFAT;
    return FilesystemType::Other;
}

PartitionScheme VolumeInspector::normalizePartitionScheme(const std::string &name)
{
    std::string value = toLower(name);
    if (value == "dos" || value == "mbr" || value == "fdisk_partition_scheme")
        return PartitionScheme::MBR;
    if (value == "gpt" || value == "guid_partition_scheme")
        return PartitionScheme::GPT;
    return PartitionScheme::Unknown;
}

std::string VolumeInspector::getFilesystemName(FilesystemType type)
{
    switch (type)
    {
    case FilesystemType::FAT32:
        return "FAT32";
    case FilesystemType::NTFS:
        return "NTFS";
    case FilesystemType::exFAT:
        return "exFAT";
    case FilesystemType::Other:
        return "Other";
    default:
        return "Unknown";
    }
}

std::string VolumeInspector::getPartitionSchemeName(PartitionScheme scheme)
{
    switch (scheme)
    {
    case PartitionScheme::MBR:
        return "MBR";
    case PartitionScheme::GPT:
        return "GPT";
    default:
        return "Unknown";
    }
}

std::unique_ptr<VolumeInfoProvider> VolumeInspector::createPlatformProvider()
{
#if defined(__linux__)
    return std::make_unique<FallbackVolumeInfoProvider>(
        std::make_unique<NativeLinuxVolumeInfoProvider>(),
        std::make_unique<SubprocessVolumeInfoProvider>(SubprocessVolumeInfoProvider::Platform::Linux));
#elif defined(__APPLE__)
    return std::make_unique<SubprocessVolumeInfoProvider>(SubprocessVolumeInfoProvider::Platform::MacOS);
#elif defined(_WIN32)
    return std::make_unique<SubprocessVolumeInfoProvider>(SubprocessVolumeInfoProvider::Platform::Windows);
#else
    return std::make_unique<UnavailableVolumeInfoProvider>();
#endif
}
