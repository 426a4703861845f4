#include "core/volume_output_parser.hpp"
#include <cctype>
#include <cstring>
#include <map>
#include <sstream>

namespace
{
    std::string trim(const std::string &s)
    {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
            --end;
        return s.substr(begin, end - begin);
    }

    std::optional<uint32_t> parseLeadingNumber(const std::string &text)
    {
        std::string value = trim(text);
        size_t digits = 0;
        while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits])))
            ++digits;
        if (digits == 0 || digits > 9)
            return std::nullopt;
        return static_cast<uint32_t>(std::stoul(value.substr(0, digits)));
    }

    // "Key: value" or "Key=value" lines, keys and values trimmed
    std::map<std::string, std::string> parseKeyValues(const std::string &text, char separator)
    {
        std::map<std::string, std::string> values;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
        {
            size_t pos = line.find(separator);
            if (pos == std::string::npos)
                continue;
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (!key.empty() && values.find(key) == values.end())
                values[key] = value;
        }
        return values;
    }

    std::optional<std::string> nonEmpty(const std::map<std::string, std::string> &values, const std::string &key)
    {
        auto it = values.find(key);
        if (it == values.end() || it->second.empty())
            return std::nullopt;
        return it->second;
    }
}

std::vector<MountEntry> VolumeOutputParser::parseProcMounts(const std::string &text)
{
    std::vector<MountEntry> mounts;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line))
    {
        std::istringstream iss(line);
        std::string device, mount_point, type;
        if (iss >> device >> mount_point >> type)
        {
            MountEntry entry;
            entry.device = decodeMountEscapes(device);
            entry.mount_point = decodeMountEscapes(mount_point);
            entry.fs_type = type;
            mounts.push_back(entry);
        }
    }
    return mounts;
}

std::string VolumeOutputParser::decodeMountEscapes(const std::string &field)
{
    std::string decoded;
    decoded.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i)
    {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '3' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7')
        {
            decoded += static_cast<char>(((field[i + 1] - '0') << 6) | ((field[i + 2] - '0') << 3) | (field[i + 3] - '0'));
            i += 3;
        }
        else
        {
            decoded += field[i];
        }
    }
    return decoded;
}

std::optional<MountEntry> VolumeOutputParser::findMountForPath(const std::vector<MountEntry> &mounts, const std::string &path)
{
    std::optional<MountEntry> best;
    for (const auto &entry : mounts)
    {
        const std::string &mp = entry.mount_point;
        bool matches = false;
        if (mp == "/")
            matches = !path.empty() && path[0] == '/';
        else if (path.compare(0, mp.size(), mp) == 0)
            matches = path.size() == mp.size() || path[mp.size()] == '/';

        // Later entries shadow earlier ones on the same mount point
        if (matches && (!best || mp.size() >= best->mount_point.size()))
            best = entry;
    }
    return best;
}

FindmntOutput VolumeOutputParser::parseFindmnt(const std::string &text)
{
    FindmntOutput output;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        std::istringstream iss(line);
        std::string fs_type, source;
        if (iss >> fs_type)
        {
            output.fs_type = fs_type;
            if (iss >> source)
                output.source = source;
            break;
        }
    }
    return output;
}

std::optional<std::string> VolumeOutputParser::parseLsblkPartitionTable(const std::string &text)
{
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        std::string value = trim(line);
        if (!value.empty())
            return value;
    }
    return std::nullopt;
}

std::optional<uint32_t> VolumeOutputParser::parseStatBlockSize(const std::string &text)
{
    auto size = parseLeadingNumber(text);
    if (!size || *size == 0)
        return std::nullopt;
    return size;
}

DiskutilOutput VolumeOutputParser::parseDiskutil(const std::string &text)
{
    auto values = parseKeyValues(text, ':');

    DiskutilOutput output;
    output.file_system_personality = nonEmpty(values, "File System Personality");
    if (!output.file_system_personality)
        output.file_system_personality = nonEmpty(values, "Type (Bundle)");
    output.part_of_whole = nonEmpty(values, "Part of Whole");
    output.content = nonEmpty(values, "Content (IOContent)");

    auto block = nonEmpty(values, "Allocation Block Size");
    if (block)
        output.allocation_block_size = parseLeadingNumber(*block);

    return output;
}

WmicVolumeOutput VolumeOutputParser::parseWmicVolume(const std::string &text)
{
    auto values = parseKeyValues(text, '=');

    WmicVolumeOutput output;
    output.file_system = nonEmpty(values, "FileSystem");
    auto block = nonEmpty(values, "BlockSize");
    if (block)
        output.block_size = parseLeadingNumber(*block);
    return output;
}

std::optional<std::string> VolumeOutputParser::parseWindowsPartitionStyle(const std::string &text)
{
    auto value = parseLsblkPartitionTable(text);
    if (!value)
        return std::nullopt;
    for (char c : *value)
    {
        if (!std::isalpha(static_cast<unsigned char>(c)))
            return std::nullopt;
    }
    return value;
}

std::optional<std::string> VolumeOutputParser::classifyPartitionSector(const uint8_t *data, size_t size)
{
    if (size >= 520 && std::memcmp(data + 512, "EFI PART", 8) == 0)
        return std::string("gpt");

    if (size < 512 || data[510] != 0x55 || data[511] != 0xAA)
        return std::nullopt;

    bool any_partition = false;
    for (int i = 0; i < 4; ++i)
    {
        const uint8_t *entry = data + 446 + 16 * i;
        uint8_t status = entry[0];
        uint8_t type = entry[4];
        if (type == 0xEE)
            return std::string("gpt");
        // A boot sector without a partition table has code here, not status flags
        if (status != 0x00 && status != 0x80)
            return std::nullopt;
        if (type != 0)
            any_partition = true;
    }

    if (!any_partition)
        return std::nullopt;
    return std::string("dos");
}
