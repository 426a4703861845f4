#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/issue_record.hpp"
#include "core/scan_limits.hpp"

namespace fs = std::filesystem;

/**
 * @brief One regular file found under the scan root
 */
struct FileNode
{
    std::string path;          // used to open the file
    std::string relative_path; // relative to the scan root, native separator
    int depth;                 // 0 for files directly in the root
    int64_t size_bytes;
};

struct WalkStatistics
{
    size_t total_files = 0; // including files that could not be stat'ed
    size_t root_folders = 0;
    size_t directories = 0; // root included
    size_t unreadable_entries = 0;
    int max_depth = 0;
};

struct WalkResult
{
    std::vector<FileNode> files;
    std::vector<IssueRecord> issues;
    WalkStatistics stats;
};

/**
 * @brief Enumerates the scan root and checks the folder structure limits
 *
 * Directory entries are visited in name order, so the file list and the
 * issue list come out the same on every run over an unchanged tree.
 */
class TreeWalker
{
public:
    explicit TreeWalker(const ScanLimits &limits);

    /**
     * @brief Walk every entry below `root` exactly once
     * @throws ScanError if the root is not a readable directory
     */
    WalkResult walk(const std::string &root) const;

    // Characters of `filename` outside the allow-list, each listed once in order of appearance
    std::vector<std::string> invalidCharacters(const std::string &filename) const;

private:
    struct WalkState;

    void walkDirectory(const fs::path &dir, int depth, WalkState &state) const;
    void checkFile(const FileNode &node, const std::string &filename, std::vector<IssueRecord> &issues) const;
    bool isAllowedCharacter(const std::string &character) const;

    ScanLimits limits_;
};
