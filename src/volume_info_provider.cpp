#include "core/volume_info_provider.hpp"
#include "core/volume_output_parser.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <sys/statvfs.h>
#endif

namespace fs = std::filesystem;

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#endif

std::optional<std::string> runCommand(const std::string &command)
{
#ifdef _WIN32
    std::string full = command + " 2>NUL";
#else
    std::string full = command + " 2>/dev/null";
#endif

    FILE *pipe = popen(full.c_str(), "r");
    if (!pipe)
    {
        Logger::debug("Failed to execute command: " + command);
        return std::nullopt;
    }

    std::string output;
    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
    {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status != 0)
    {
        Logger::debug("Command exited with status " + std::to_string(status) + ": " + command);
        return std::nullopt;
    }
    return output;
}

// ---------------------------------------------------------------- native

NativeLinuxVolumeInfoProvider::NativeLinuxVolumeInfoProvider(std::string proc_mounts, std::string sys_block_dir,
                                                             std::string dev_dir)
    : proc_mounts_(std::move(proc_mounts)), sys_block_dir_(std::move(sys_block_dir)), dev_dir_(std::move(dev_dir))
{
}

VolumeFacts NativeLinuxVolumeInfoProvider::query(const std::string &mount_path)
{
    VolumeFacts facts;

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(mount_path), ec);
    std::string path = ec ? mount_path : canonical.string();

    std::ifstream mounts_file(proc_mounts_);
    if (!mounts_file.is_open())
    {
        facts.filesystem_note = "cannot read " + proc_mounts_;
        facts.partition_note = facts.filesystem_note;
    }
    else
    {
        std::stringstream content;
        content << mounts_file.rdbuf();
        auto entry = VolumeOutputParser::findMountForPath(VolumeOutputParser::parseProcMounts(content.str()), path);
        if (!entry)
        {
            facts.filesystem_note = "no mount entry for " + path;
            facts.partition_note = facts.filesystem_note;
        }
        else
        {
            Logger::debug("Mount for " + path + ": " + entry->device + " on " + entry->mount_point + " (" +
                          entry->fs_type + ")");
            facts.filesystem_name = entry->fs_type;
            readPartitionTable(entry->device, facts);
        }
    }

#ifndef _WIN32
    struct statvfs stats;
    if (statvfs(path.c_str(), &stats) == 0 && stats.f_bsize > 0)
    {
        facts.cluster_size_bytes = static_cast<uint32_t>(stats.f_bsize);
    }
    else
    {
        facts.cluster_note = "statvfs failed: " + std::generic_category().message(errno);
    }
#else
    facts.cluster_note = "statvfs not available";
#endif

    return facts;
}

void NativeLinuxVolumeInfoProvider::readPartitionTable(const std::string &device, VolumeFacts &facts) const
{
    const std::string dev_prefix = "/dev/";
    if (device.compare(0, dev_prefix.size(), dev_prefix) != 0)
    {
        facts.partition_note = device + " is not a block device";
        return;
    }

    std::string node = fs::path(device).filename().string();
    fs::path sys_entry = fs::path(sys_block_dir_) / node;

    // A partition's sysfs entry sits inside its disk's directory
    std::error_code ec;
    std::string disk = node;
    if (fs::exists(sys_entry / "partition", ec))
    {
        fs::path resolved = fs::canonical(sys_entry, ec);
        if (!ec)
            disk = resolved.parent_path().filename().string();
    }

    fs::path disk_path = fs::path(dev_dir_) / disk;
    std::ifstream in(disk_path, std::ios::binary);
    if (!in.is_open())
    {
        facts.partition_note = "cannot read " + disk_path.string() + ": " + std::generic_category().message(errno);
        return;
    }

    std::vector<uint8_t> sectors(1024);
    in.read(reinterpret_cast<char *>(sectors.data()), static_cast<std::streamsize>(sectors.size()));
    sectors.resize(static_cast<size_t>(in.gcount()));

    auto table = VolumeOutputParser::classifyPartitionSector(sectors.data(), sectors.size());
    if (table)
        facts.partition_table = table;
    else
        facts.partition_note = "no partition table recognised on " + disk_path.string();
}

// ---------------------------------------------------------------- subprocess

SubprocessVolumeInfoProvider::SubprocessVolumeInfoProvider(Platform platform, CommandRunner runner)
    : platform_(platform), runner_(std::move(runner))
{
}

VolumeFacts SubprocessVolumeInfoProvider::query(const std::string &mount_path)
{
    switch (platform_)
    {
    case Platform::Linux:
        return queryLinux(mount_path);
    case Platform::MacOS:
        return queryMacOS(mount_path);
    case Platform::Windows:
        return queryWindows(mount_path);
    }
    return VolumeFacts{};
}

std::string SubprocessVolumeInfoProvider::shellQuote(const std::string &argument)
{
    std::string quoted = "'";
    for (char c : argument)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

VolumeFacts SubprocessVolumeInfoProvider::queryLinux(const std::string &mount_path)
{
    VolumeFacts facts;
    std::string quoted = shellQuote(mount_path);

    auto findmnt = runner_("findmnt -n -o FSTYPE,SOURCE --target " + quoted);
    FindmntOutput mount;
    if (findmnt)
        mount = VolumeOutputParser::parseFindmnt(*findmnt);

    if (mount.fs_type)
        facts.filesystem_name = mount.fs_type;
    else
        facts.filesystem_note = findmnt ? "unrecognised findmnt output" : "findmnt failed";

    if (mount.source)
    {
        auto lsblk = runner_("lsblk -no PTTYPE " + shellQuote(*mount.source));
        auto table = lsblk ? VolumeOutputParser::parseLsblkPartitionTable(*lsblk) : std::nullopt;
        if (table)
            facts.partition_table = table;
        else
            facts.partition_note = lsblk ? "lsblk reported no partition table" : "lsblk failed";
    }
    else
    {
        facts.partition_note = "backing device unknown";
    }

    auto stat = runner_("stat -f -c %S " + quoted);
    auto block = stat ? VolumeOutputParser::parseStatBlockSize(*stat) : std::nullopt;
    if (block)
        facts.cluster_size_bytes = block;
    else
        facts.cluster_note = stat ? "unrecognised stat output" : "stat failed";

    return facts;
}

VolumeFacts SubprocessVolumeInfoProvider::queryMacOS(const std::string &mount_path)
{
    VolumeFacts facts;

    auto info = runner_("diskutil info " + shellQuote(mount_path));
    if (!info)
    {
        facts.filesystem_note = "diskutil failed";
        facts.partition_note = facts.filesystem_note;
        facts.cluster_note = facts.filesystem_note;
        return facts;
    }

    DiskutilOutput volume = VolumeOutputParser::parseDiskutil(*info);
    if (volume.file_system_personality)
        facts.filesystem_name = volume.file_system_personality;
    else
        facts.filesystem_note = "unrecognised diskutil output";

    if (volume.allocation_block_size)
        facts.cluster_size_bytes = volume.allocation_block_size;
    else
        facts.cluster_note = "diskutil reported no allocation block size";

    if (!volume.part_of_whole)
    {
        facts.partition_note = "diskutil reported no parent disk";
        return facts;
    }

    auto disk_info = runner_("diskutil info " + shellQuote(*volume.part_of_whole));
    DiskutilOutput disk;
    if (disk_info)
        disk = VolumeOutputParser::parseDiskutil(*disk_info);

    if (disk.content)
        facts.partition_table = disk.content;
    else
        facts.partition_note = disk_info ? "diskutil reported no partition scheme" : "diskutil failed for " + *volume.part_of_whole;

    return facts;
}

VolumeFacts SubprocessVolumeInfoProvider::queryWindows(const std::string &mount_path)
{
    VolumeFacts facts;

    if (mount_path.size() < 2 || mount_path[1] != ':' || !std::isalpha(static_cast<unsigned char>(mount_path[0])))
    {
        facts.filesystem_note = "not a drive letter path: " + mount_path;
        facts.partition_note = facts.filesystem_note;
        facts.cluster_note = facts.filesystem_note;
        return facts;
    }

    std::string letter(1, static_cast<char>(std::toupper(static_cast<unsigned char>(mount_path[0]))));

    auto wmic = runner_("wmic volume where \"DriveLetter='" + letter + ":'\" get FileSystem,BlockSize /format:list");
    WmicVolumeOutput volume;
    if (wmic)
        volume = VolumeOutputParser::parseWmicVolume(*wmic);

    if (volume.file_system)
        facts.filesystem_name = volume.file_system;
    else
        facts.filesystem_note = wmic ? "unrecognised wmic output" : "wmic failed";

    if (volume.block_size)
        facts.cluster_size_bytes = volume.block_size;
    else
        facts.cluster_note = wmic ? "wmic reported no block size" : "wmic failed";

    auto style = runner_("powershell -NoProfile -Command \"(Get-Partition -DriveLetter " + letter +
                         " | Get-Disk).PartitionStyle\"");
    auto table = style ? VolumeOutputParser::parseWindowsPartitionStyle(*style) : std::nullopt;
    if (table)
        facts.partition_table = table;
    else
        facts.partition_note = style ? "unrecognised partition style" : "Get-Partition failed";

    return facts;
}

// ---------------------------------------------------------------- fallback

FallbackVolumeInfoProvider::FallbackVolumeInfoProvider(std::unique_ptr<VolumeInfoProvider> primary,
                                                       std::unique_ptr<VolumeInfoProvider> secondary)
    : primary_(std::move(primary)), secondary_(std::move(secondary))
{
}

VolumeFacts FallbackVolumeInfoProvider::query(const std::string &mount_path)
{
    VolumeFacts facts = primary_->query(mount_path);
    if (facts.complete())
        return facts;

    Logger::debug(primary_->name() + " volume query incomplete, asking " + secondary_->name());
    VolumeFacts extra = secondary_->query(mount_path);

    if (!facts.filesystem_name)
    {
        facts.filesystem_name = extra.filesystem_name;
        if (!extra.filesystem_name)
            facts.filesystem_note += "; " + extra.filesystem_note;
    }
    if (!facts.partition_table)
    {
        facts.partition_table = extra.partition_table;
        if (!extra.partition_table)
            facts.partition_note += "; " + extra.partition_note;
    }
    if (!facts.cluster_size_bytes)
    {
        facts.cluster_size_bytes = extra.cluster_size_bytes;
        if (!extra.cluster_size_bytes)
            facts.cluster_note += "; " + extra.cluster_note;
    }
    return facts;
}

std::string FallbackVolumeInfoProvider::name() const
{
    return primary_->name() + "+" + secondary_->name();
}

// ---------------------------------------------------------------- unavailable

VolumeFacts UnavailableVolumeInfoProvider::query(const std::string &mount_path)
{
    VolumeFacts facts;
    facts.filesystem_note = "volume introspection not supported on this platform";
    facts.partition_note = facts.filesystem_note;
    facts.cluster_note = facts.filesystem_note;
    Logger::debug("No volume information available for " + mount_path);
    return facts;
}
