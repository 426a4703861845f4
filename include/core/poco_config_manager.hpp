#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Process-wide configuration backed by a Poco JSONConfiguration
 *
 * Keys are dotted paths ("limits.max_path_length"). Every getter takes a
 * default, so a config file only needs to carry the keys it overrides.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    std::vector<std::string> getList(const std::string &key, const std::string &def = "") const;
    std::vector<int> getIntList(const std::string &key, const std::string &def = "") const;
    bool hasKey(const std::string &key) const;

    std::string getLogLevel() const;
    int getWorkerCount() const;

    bool validateConfig() const;

    // Discard loaded values and restore the built-in defaults
    void resetToDefaults();

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
