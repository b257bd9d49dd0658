#pragma once

#include "core/settings.hpp"
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Poco-backed configuration store for the watcher and coordinator processes
 *
 * Values live in a Poco JSONConfiguration keyed by dotted paths
 * ("watcher.min_file_size_mb"). Files may be JSON or YAML; YAML is converted
 * to JSON before it is applied on top of the built-in defaults.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;
    std::string getLoadedPath() const;

    /**
     * @brief Load the first config file found in the standard search locations
     * @return true if a file was loaded, false if defaults are in use
     */
    bool loadFromSearchPaths();
    static std::vector<std::string> searchPaths();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    std::vector<std::string> getStringList(const std::string &key, const std::vector<std::string> &def = {}) const;
    bool hasKey(const std::string &key) const;

    // Typed sections
    WatcherSettings getWatcherSettings() const;
    NetworkShareSettings getNetworkShareSettings() const;
    RenamerSettings getRenamerSettings() const;
    VersionDetectionSettings getVersionDetectionSettings() const;
    TransferSettings getTransferSettings() const;
    CoordinatorSettings getCoordinatorSettings() const;
    DatabaseSettings getDatabaseSettings() const;
    WebSettings getWebSettings() const;
    LoggingSettings getLoggingSettings() const;

    /**
     * @brief Check value ranges that would make the pipeline misbehave
     * @param errors Receives one message per problem found
     */
    bool validateConfig(std::vector<std::string> &errors) const;

    static nlohmann::json defaultConfig();
    static nlohmann::json yamlFileToJson(const std::string &path);

private:
    void applyPatch(const nlohmann::json &patch);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
    std::string loaded_path_;
};
