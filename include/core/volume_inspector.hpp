#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/issue_record.hpp"
#include "core/volume_info_provider.hpp"

enum class FilesystemType
{
    FAT32,
    NTFS,
    exFAT,
    Other,
    Unknown
};

enum class PartitionScheme
{
    MBR,
    GPT,
    Unknown
};

struct VolumeProfile
{
    FilesystemType filesystem = FilesystemType::Unknown;
    PartitionScheme partition_scheme = PartitionScheme::Unknown;
    std::optional<uint32_t> cluster_size_bytes;
    std::string filesystem_name; // as reported by the platform, empty if unknown
};

struct VolumeInspection
{
    VolumeProfile profile;
    std::vector<IssueRecord> issues;
};

/**
 * @brief Checks the filesystem, partition scheme and cluster size of the target volume
 *
 * Never fails: a field the provider cannot determine becomes Unknown and an
 * Info record says so.
 */
class VolumeInspector
{
public:
    explicit VolumeInspector(std::unique_ptr<VolumeInfoProvider> provider, uint32_t recommended_cluster_size = 32768);

    VolumeInspection inspect(const std::string &mount_path) const;

    static FilesystemType normalizeFilesystem(const std::string &name);
    static PartitionScheme normalizePartitionScheme(const std::string &name);

    static std::string getFilesystemName(FilesystemType type);
    static std::string getPartitionSchemeName(PartitionScheme scheme);

    /**
     * @brief Provider for the platform this binary was built for
     *
     * Linux: kernel interfaces with command line tools as fallback.
     * macOS: diskutil. Windows: wmic and PowerShell. Anything else: unavailable.
     */
    static std::unique_ptr<VolumeInfoProvider> createPlatformProvider();

private:
    std::unique_ptr<VolumeInfoProvider> provider_;
    uint32_t recommended_cluster_size_;
};
