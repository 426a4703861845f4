#include "core/tree_walker.hpp"
#include "core/file_utils.hpp"
#include "core/scan_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

struct TreeWalker::WalkState
{
    fs::path root;
    WalkResult result;
};

TreeWalker::TreeWalker(const ScanLimits &limits) : limits_(limits)
{
}

WalkResult TreeWalker::walk(const std::string &root) const
{
    std::string error_message;
    if (!FileUtils::isReadableDirectory(root, error_message))
    {
        throw ScanError(error_message);
    }

    std::error_code ec;
    fs::path root_path = fs::absolute(fs::path(root), ec);
    if (ec)
        root_path = fs::path(root);
    root_path = root_path.lexically_normal();
    if (!root_path.has_filename() && root_path.has_relative_path())
        root_path = root_path.parent_path();

    Logger::info("Walking directory tree: " + root_path.string());

    WalkState state;
    state.root = root_path;
    walkDirectory(root_path, 0, state);

    WalkResult &result = state.result;
    const WalkStatistics &stats = result.stats;

    if (stats.total_files > limits_.max_total_files)
    {
        result.issues.emplace_back("", IssueCategory::TotalFileCount, IssueSeverity::Error,
                                   "Total files: " + std::to_string(stats.total_files) + " exceeds maximum " +
                                       std::to_string(limits_.max_total_files));
    }
    if (stats.root_folders > limits_.max_root_folders)
    {
        result.issues.emplace_back("", IssueCategory::RootFolderCount, IssueSeverity::Error,
                                   "Root folders: " + std::to_string(stats.root_folders) + " exceeds maximum " +
                                       std::to_string(limits_.max_root_folders));
    }

    Logger::info("Found " + std::to_string(stats.total_files) + " files in " + std::to_string(stats.directories) +
                 " directories (max depth " + std::to_string(stats.max_depth) + ")");
    return std::move(state.result);
}

void TreeWalker::walkDirectory(const fs::path &dir, int depth, WalkState &state) const
{
    WalkResult &result = state.result;
    std::string relative_dir = FileUtils::relativePath(dir, state.root);

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        Logger::warn("Could not open directory " + dir.string() + ": " + ec.message());
        result.issues.emplace_back(relative_dir, IssueCategory::ReadError, IssueSeverity::Warning,
                                   "Could not open directory: " + ec.message());
        ++result.stats.unreadable_entries;
        return;
    }

    ++result.stats.directories;

    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        entries.push_back(*it);
    }
    if (ec)
    {
        Logger::warn("Error while listing " + dir.string() + ": " + ec.message());
        result.issues.emplace_back(relative_dir, IssueCategory::ReadError, IssueSeverity::Warning,
                                   "Directory listing incomplete: " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b)
              { return a.path().filename().native() < b.path().filename().native(); });

    size_t direct_files = 0;
    std::vector<fs::path> subdirectories;

    for (const auto &entry : entries)
    {
        std::string relative = FileUtils::relativePath(entry.path(), state.root);

        std::error_code status_ec;
        fs::file_status status = entry.status(status_ec);
        if (status_ec)
        {
            // Unknown kind, counted as a file
            ++direct_files;
            ++result.stats.total_files;
            ++result.stats.unreadable_entries;
            Logger::warn("Could not stat " + entry.path().string() + ": " + status_ec.message());
            result.issues.emplace_back(relative, IssueCategory::ReadError, IssueSeverity::Warning,
                                       "Could not read file attributes: " + status_ec.message());
            continue;
        }

        if (fs::is_directory(status))
        {
            subdirectories.push_back(entry.path());
            if (depth == 0)
                ++result.stats.root_folders;
            continue;
        }

        if (!fs::is_regular_file(status))
            continue;

        ++direct_files;
        ++result.stats.total_files;

        std::error_code size_ec;
        uintmax_t size = entry.file_size(size_ec);
        if (size_ec)
        {
            ++result.stats.unreadable_entries;
            Logger::warn("Could not stat " + entry.path().string() + ": " + size_ec.message());
            result.issues.emplace_back(relative, IssueCategory::ReadError, IssueSeverity::Warning,
                                       "Could not read file attributes: " + size_ec.message());
            continue;
        }

        FileNode node{FileUtils::toUtf8(entry.path()), relative, depth, static_cast<int64_t>(size)};
        result.stats.max_depth = std::max(result.stats.max_depth, depth);
        checkFile(node, FileUtils::toUtf8(entry.path().filename()), result.issues);
        result.files.push_back(std::move(node));
    }

    if (direct_files > limits_.max_files_per_folder)
    {
        result.issues.emplace_back(relative_dir, IssueCategory::FilesPerFolder, IssueSeverity::Error,
                                   "Folder contains " + std::to_string(direct_files) + " files (max " +
                                       std::to_string(limits_.max_files_per_folder) + ")");
    }

    for (const auto &subdirectory : subdirectories)
    {
        walkDirectory(subdirectory, depth + 1, state);
    }
}

void TreeWalker::checkFile(const FileNode &node, const std::string &filename, std::vector<IssueRecord> &issues) const
{
    if (node.depth > limits_.max_nesting_depth)
    {
        issues.emplace_back(node.relative_path, IssueCategory::NestingDepth, IssueSeverity::Error,
                            "Nesting depth " + std::to_string(node.depth) + " exceeds maximum " +
                                std::to_string(limits_.max_nesting_depth));
    }

    size_t path_length = FileUtils::utf8Length(node.relative_path);
    if (path_length > limits_.max_path_length)
    {
        issues.emplace_back(node.relative_path, IssueCategory::PathLength, IssueSeverity::Error,
                            "Path too long (" + std::to_string(path_length) + " chars, max " +
                                std::to_string(limits_.max_path_length) + ")");
    }

    size_t name_length = FileUtils::utf8Length(filename);
    if (name_length > limits_.max_filename_length)
    {
        issues.emplace_back(node.relative_path, IssueCategory::FilenameLength, IssueSeverity::Warning,
                            "Filename too long (" + std::to_string(name_length) + " chars, max " +
                                std::to_string(limits_.max_filename_length) + ")");
    }

    auto invalid = invalidCharacters(filename);
    if (!invalid.empty())
    {
        std::string listed;
        for (const auto &c : invalid)
        {
            if (!listed.empty())
                listed += " ";
            listed += c;
        }
        issues.emplace_back(node.relative_path, IssueCategory::InvalidCharacters, IssueSeverity::Warning,
                            "Filename contains invalid characters: " + listed);
    }
}

std::vector<std::string> TreeWalker::invalidCharacters(const std::string &filename) const
{
    std::vector<std::string> invalid;
    for (const auto &character : FileUtils::utf8Characters(filename))
    {
        if (!isAllowedCharacter(character) &&
            std::find(invalid.begin(), invalid.end(), character) == invalid.end())
        {
            invalid.push_back(character);
        }
    }
    return invalid;
}

bool TreeWalker::isAllowedCharacter(const std::string &character) const
{
    if (character.size() != 1)
        return false;

    unsigned char c = static_cast<unsigned char>(character[0]);
    if (c >= 0x80)
        return false;
    if (std::isalnum(c) || c == ' ')
        return true;
    return limits_.allowed_punctuation.find(static_cast<char>(c)) != std::string::npos;
}
