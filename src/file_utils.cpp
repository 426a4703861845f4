#include "core/file_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    // Length of the UTF-8 sequence introduced by `lead`, 1 for invalid lead bytes
    size_t sequenceLength(unsigned char lead)
    {
        if (lead < 0x80)
            return 1;
        if ((lead & 0xE0) == 0xC0)
            return 2;
        if ((lead & 0xF0) == 0xE0)
            return 3;
        if ((lead & 0xF8) == 0xF0)
            return 4;
        return 1;
    }

    bool isContinuation(unsigned char c)
    {
        return (c & 0xC0) == 0x80;
    }

    size_t nextCharacter(const std::string &text, size_t pos)
    {
        size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size())
            return pos + 1;
        for (size_t i = 1; i < len; ++i)
        {
            if (!isContinuation(static_cast<unsigned char>(text[pos + i])))
                return pos + 1;
        }
        return pos + len;
    }
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

bool FileUtils::isReadableDirectory(const std::string &path, std::string &error_message)
{
    if (!isValidDirectory(path))
    {
        error_message = "Invalid directory path: " + path;
        return false;
    }

    std::error_code ec;
    fs::directory_iterator it(fs::path(path), ec);
    if (ec)
    {
        error_message = "Could not access directory " + path + ": " + ec.message();
        return false;
    }
    return true;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
    {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileUtils::relativePath(const fs::path &path, const fs::path &root)
{
    fs::path relative = path.lexically_relative(root);
    if (relative.empty())
    {
        // Not below root, keep the path as given
        relative = path;
    }
    return toUtf8(relative.make_preferred());
}

std::string FileUtils::toUtf8(const fs::path &path)
{
    return path.u8string();
}

size_t FileUtils::utf8Length(const std::string &text)
{
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size())
    {
        pos = nextCharacter(text, pos);
        ++count;
    }
    return count;
}

std::vector<std::string> FileUtils::utf8Characters(const std::string &text)
{
    std::vector<std::string> characters;
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t next = nextCharacter(text, pos);
        characters.push_back(text.substr(pos, next - pos));
        pos = next;
    }
    return characters;
}
