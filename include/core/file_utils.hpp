#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Path and filename helpers shared by the walker and the probes
 */
class FileUtils
{
public:
    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * Checks that a directory can actually be listed
     * @param path Directory to open
     * @param error_message Filled with the OS error when the directory cannot be opened
     */
    static bool isReadableDirectory(const std::string &path, std::string &error_message);

    /**
     * Lower-case extension without the leading dot ("Song.MP3" -> "mp3")
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * Path of `path` relative to `root`, using the native separator and UTF-8
     * encoding. The root itself maps to ".".
     */
    static std::string relativePath(const fs::path &path, const fs::path &root);

    // UTF-8 encoded form of a path, independent of the platform's native encoding
    static std::string toUtf8(const fs::path &path);

    /**
     * Number of characters (Unicode code points) in a UTF-8 string.
     * Invalid bytes count as one character each.
     */
    static size_t utf8Length(const std::string &text);

    // Splits a UTF-8 string into its characters
    static std::vector<std::string> utf8Characters(const std::string &text);
};
