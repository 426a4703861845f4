#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct MountEntry
{
    std::string device;      // e.g. "/dev/sdb1"
    std::string mount_point; // e.g. "/media/user/USB DRIVE"
    std::string fs_type;     // e.g. "vfat"
};

struct FindmntOutput
{
    std::optional<std::string> fs_type;
    std::optional<std::string> source;
};

struct DiskutilOutput
{
    std::optional<std::string> file_system_personality; // "MS-DOS FAT32"
    std::optional<uint32_t> allocation_block_size;
    std::optional<std::string> part_of_whole; // "disk2"
    std::optional<std::string> content;       // "FDisk_partition_scheme" on the whole disk
};

struct WmicVolumeOutput
{
    std::optional<std::string> file_system;
    std::optional<uint32_t> block_size;
};

/**
 * @brief Parsers for the raw text of platform volume tools
 *
 * The tools' output is not a stable interface. Every parser returns empty
 * fields for anything it does not recognise instead of failing.
 */
class VolumeOutputParser
{
public:
    // /proc/mounts content; octal escapes (\040 for space) are decoded
    static std::vector<MountEntry> parseProcMounts(const std::string &text);
    static std::string decodeMountEscapes(const std::string &field);

    /**
     * @brief Entry whose mount point is the longest prefix of `path`
     * @param path Absolute, canonical path
     */
    static std::optional<MountEntry> findMountForPath(const std::vector<MountEntry> &mounts, const std::string &path);

    // `findmnt -n -o FSTYPE,SOURCE --target <path>`
    static FindmntOutput parseFindmnt(const std::string &text);

    // `lsblk -no PTTYPE <device>`: "dos", "gpt" or empty
    static std::optional<std::string> parseLsblkPartitionTable(const std::string &text);

    // `stat -f -c %S <path>`
    static std::optional<uint32_t> parseStatBlockSize(const std::string &text);

    // `diskutil info <path-or-disk>`
    static DiskutilOutput parseDiskutil(const std::string &text);

    // `wmic volume ... get FileSystem,BlockSize /format:list`
    static WmicVolumeOutput parseWmicVolume(const std::string &text);

    // `(Get-Partition ... | Get-Disk).PartitionStyle`: "MBR", "GPT" or "RAW"
    static std::optional<std::string> parseWindowsPartitionStyle(const std::string &text);

    /**
     * @brief Partition table type from the first sectors of a disk
     * @param data At least the first 512 bytes; 1024 to see the GPT header
     * @return "gpt", "dos" or nullopt when no partition table is recognised
     */
    static std::optional<std::string> classifyPartitionSector(const uint8_t *data, size_t size);
};
