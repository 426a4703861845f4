#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Raw volume metadata as reported by one platform facility
 *
 * Values are not normalized. A missing field comes with a note saying why.
 */
struct VolumeFacts
{
    std::optional<std::string> filesystem_name;
    std::optional<std::string> partition_table;
    std::optional<uint32_t> cluster_size_bytes;

    std::string filesystem_note;
    std::string partition_note;
    std::string cluster_note;

    bool complete() const { return filesystem_name && partition_table && cluster_size_bytes; }
};

/**
 * @brief Source of filesystem, partition table and allocation unit for a mount point
 */
class VolumeInfoProvider
{
public:
    virtual ~VolumeInfoProvider() = default;

    virtual VolumeFacts query(const std::string &mount_path) = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Runs a shell command and returns its standard output
 * @return nullopt if the command could not be started or exited non-zero
 */
using CommandRunner = std::function<std::optional<std::string>(const std::string &command)>;

std::optional<std::string> runCommand(const std::string &command);

/**
 * @brief Linux kernel interfaces: /proc/mounts, statvfs and the raw block device
 *
 * Reading the partition table needs read access to the parent block device,
 * which usually means root. Without it the partition field stays empty.
 */
class NativeLinuxVolumeInfoProvider : public VolumeInfoProvider
{
public:
    explicit NativeLinuxVolumeInfoProvider(std::string proc_mounts = "/proc/mounts",
                                           std::string sys_block_dir = "/sys/class/block",
                                           std::string dev_dir = "/dev");

    VolumeFacts query(const std::string &mount_path) override;
    std::string name() const override { return "native"; }

private:
    void readPartitionTable(const std::string &device, VolumeFacts &facts) const;

    std::string proc_mounts_;
    std::string sys_block_dir_;
    std::string dev_dir_;
};

/**
 * @brief Platform command line tools (findmnt/lsblk/stat, diskutil, wmic/PowerShell)
 */
class SubprocessVolumeInfoProvider : public VolumeInfoProvider
{
public:
    enum class Platform
    {
        Linux,
        MacOS,
        Windows
    };

    explicit SubprocessVolumeInfoProvider(Platform platform, CommandRunner runner = runCommand);

    VolumeFacts query(const std::string &mount_path) override;
    std::string name() const override { return "subprocess"; }

    // Single-quote a POSIX shell argument
    static std::string shellQuote(const std::string &argument);

private:
    VolumeFacts queryLinux(const std::string &mount_path);
    VolumeFacts queryMacOS(const std::string &mount_path);
    VolumeFacts queryWindows(const std::string &mount_path);

    Platform platform_;
    CommandRunner runner_;
};

/**
 * @brief Asks `primary` first and fills the fields it left empty from `secondary`
 */
class FallbackVolumeInfoProvider : public VolumeInfoProvider
{
public:
    FallbackVolumeInfoProvider(std::unique_ptr<VolumeInfoProvider> primary,
                               std::unique_ptr<VolumeInfoProvider> secondary);

    VolumeFacts query(const std::string &mount_path) override;
    std::string name() const override;

private:
    std::unique_ptr<VolumeInfoProvider> primary_;
    std::unique_ptr<VolumeInfoProvider> secondary_;
};

// Used on platforms without a known facility; every field stays empty
class UnavailableVolumeInfoProvider : public VolumeInfoProvider
{
public:
    VolumeFacts query(const std::string &mount_path) override;
    std::string name() const override { return "unavailable"; }
};
