#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    void applyPatch(JSONConfiguration &cfg, const nlohmann::json &patch)
    {
        // Flatten and set values
        std::function<void(const std::string &, const nlohmann::json &)> apply;
        apply = [&](const std::string &prefix, const nlohmann::json &node)
        {
            if (node.is_object())
            {
                for (auto it = node.begin(); it != node.end(); ++it)
                {
                    std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                    apply(key, it.value());
                }
            }
            else if (node.is_array())
            {
                // Lists are stored comma separated
                std::string joined;
                for (const auto &item : node)
                {
                    if (!joined.empty())
                        joined += ",";
                    joined += item.is_string() ? item.get<std::string>() : item.dump();
                }
                cfg.setString(prefix, joined);
            }
            else if (!node.is_null())
            {
                if (node.is_boolean())
                    cfg.setBool(prefix, node.get<bool>());
                else if (node.is_number_integer())
                    cfg.setInt(prefix, node.get<int>());
                else if (node.is_number_unsigned())
                    cfg.setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
                else if (node.is_number_float())
                    cfg.setDouble(prefix, node.get<double>());
                else if (node.is_string())
                    cfg.setString(prefix, node.get<std::string>());
                else
                    cfg.setString(prefix, node.dump());
            }
        };
        apply("", patch);
    }

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
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    try
    {
        // Let Poco validate the document, then overlay it on the current values
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);

        std::stringstream ss;
        tmp->save(ss);
        auto patch = nlohmann::json::parse(ss.str());

        std::lock_guard<std::mutex> lock(mutex_);
        applyPatch(*cfg_, patch);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to load configuration from " + path + ": " + e.displayText());
        return false;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to load configuration from " + path + ": " + e.what());
        return false;
    }

    Logger::info("Configuration loaded from " + path);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(*cfg_, patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not an integer, using default " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not a boolean, using default");
        return def;
    }
}

std::vector<std::string> PocoConfigManager::getList(const std::string &key, const std::string &def) const
{
    std::vector<std::string> items;
    for (const auto &token : split(getString(key, def), ','))
    {
        std::string item = trim(token);
        if (!item.empty())
        {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<int> PocoConfigManager::getIntList(const std::string &key, const std::string &def) const
{
    std::vector<int> values;
    for (const auto &item : getList(key, def))
    {
        try
        {
            values.push_back(std::stoi(item));
        }
        catch (const std::exception &e)
        {
            Logger::warn("Ignoring non-numeric value '" + item + "' in config key " + key);
        }
    }
    return values;
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

int PocoConfigManager::getWorkerCount() const
{
    return getInt("scan.worker_count", 0);
}

bool PocoConfigManager::validateConfig() const
{
    if (!Logger::isValidLevel(getLogLevel()))
    {
        Logger::error("Invalid log level: " + getLogLevel());
        return false;
    }

    int workers = getWorkerCount();
    if (workers < 0)
    {
        Logger::error("Invalid worker count: " + std::to_string(workers));
        return false;
    }

    const char *positive_keys[] = {
        "limits.max_total_files", "limits.max_root_folders", "limits.max_files_per_folder",
        "limits.max_nesting_depth", "limits.max_path_length", "limits.max_filename_length",
        "audio.max_album_art_bytes", "audio.vbr_sample_count"};
    for (const char *key : positive_keys)
    {
        if (getInt(key, 1) <= 0)
        {
            Logger::error(std::string("Config value must be positive: ") + key);
            return false;
        }
    }

    if (getInt("audio.min_bitrate_kbps", 32) > getInt("audio.max_bitrate_kbps", 320))
    {
        Logger::error("audio.min_bitrate_kbps exceeds audio.max_bitrate_kbps");
        return false;
    }

    return true;
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");
    cfg_->setInt("scan.worker_count", 0);

    // Structural limits of the head unit
    cfg_->setInt("limits.max_total_files", 15000);
    cfg_->setInt("limits.max_root_folders", 1000);
    cfg_->setInt("limits.max_files_per_folder", 254);
    cfg_->setInt("limits.max_nesting_depth", 8);
    cfg_->setInt("limits.max_path_length", 60);
    cfg_->setInt("limits.max_filename_length", 64);
    cfg_->setString("limits.allowed_punctuation", "-_.,()[]&'!+#");

    cfg_->setInt("volume.recommended_cluster_size", 32768);

    // Audio defaults
    cfg_->setInt("audio.min_bitrate_kbps", 32);
    cfg_->setInt("audio.max_bitrate_kbps", 320);
    cfg_->setString("audio.forbidden_bitrates_kbps", "144");
    cfg_->setString("audio.mp3_sample_rates", "32000,44100,48000");
    cfg_->setInt("audio.aac_min_sample_rate", 8000);
    cfg_->setInt("audio.aac_max_sample_rate", 96000);
    cfg_->setInt("audio.max_album_art_bytes", 750000);
    cfg_->setInt("audio.vbr_sample_count", 8);
    cfg_->setString("audio.unsupported_extensions", "flac,ogg,wav,ape");
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
