#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    nlohmann::json yamlNodeToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json obj = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                obj[it->first.as<std::string>()] = yamlNodeToJson(it->second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &item : node)
            {
                arr.push_back(yamlNodeToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar:
        {
            // Quoted scalars stay strings; plain scalars are typed by content
            if (node.Tag() == "!")
                return node.Scalar();
            long long int_value = 0;
            if (YAML::convert<long long>::decode(node, int_value))
                return int_value;
            double double_value = 0.0;
            if (YAML::convert<double>::decode(node, double_value))
                return double_value;
            bool bool_value = false;
            if (YAML::convert<bool>::decode(node, bool_value))
                return bool_value;
            return node.Scalar();
        }
        default:
            return nullptr;
        }
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    applyPatch(defaultConfig());
}

nlohmann::json PocoConfigManager::defaultConfig()
{
    return {
        {"watcher",
         {{"download_folder", ""},
          {"recursive", true},
          {"min_file_size_mb", 500},
          {"stable_time_seconds", 30},
          {"supported_extensions", {".mkv", ".mp4", ".avi", ".m4v", ".mov", ".wmv", ".flv"}},
          {"exclude_patterns", {"*.part", "*.tmp", "*.downloading"}},
          {"event_source", "inotify"},
          {"poll_interval_seconds", 5},
          {"scan_on_start", false},
          {"sampler_threads", 4}}},
        {"network_share",
         {{"mount_path", ""},
          {"target_folder", "Movies"},
          {"verify_mount", true}}},
        {"mnamer",
         {{"enabled", true},
          {"executable_path", "mnamer"},
          {"batch_mode", true},
          {"media_type", "movie"},
          {"movie_format", "{name} ({year})"},
          {"extra_args", {"--no-cache"}},
          {"timeout_seconds", 60}}},
        {"version_detection",
         {{"enabled", true},
          {"format", ".v{number}"},
          {"check_similar", true},
          {"similarity_threshold", 0.9}}},
        {"transfer",
         {{"chunk_size_bytes", 1048576},
          {"max_attempts", 3},
          {"backoff_base_ms", 1000},
          {"max_backoff_ms", 30000},
          {"verify_checksum", false},
          {"max_concurrent", 2}}},
        {"coordinator",
         {{"delete_source_on_approve", false},
          {"delete_source_on_reject", true}}},
        {"database",
         {{"path", "moviecp.db"},
          {"busy_timeout_ms", 30000}}},
        {"web",
         {{"host", "0.0.0.0"},
          {"port", 8080}}},
        {"logging",
         {{"level", "INFO"},
          {"file", ""},
          {"max_size_mb", 10},
          {"backup_count", 5}}}};
}

nlohmann::json PocoConfigManager::yamlFileToJson(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    return yamlNodeToJson(root);
}

std::vector<std::string> PocoConfigManager::searchPaths()
{
    std::vector<std::string> paths = {
        "config/config.json",
        "config/config.yaml",
        "/etc/moviecp/config.yaml"};
    const char *home = std::getenv("HOME");
    if (home != nullptr)
    {
        paths.push_back(std::string(home) + "/.config/moviecp/config.yaml");
    }
    return paths;
}

bool PocoConfigManager::loadFromSearchPaths()
{
    for (const auto &path : searchPaths())
    {
        if (std::filesystem::exists(path))
        {
            return load(path);
        }
    }
    return false;
}

bool PocoConfigManager::load(const std::string &path)
{
    nlohmann::json file_config;
    try
    {
        if (path.size() >= 5 && (path.substr(path.size() - 5) == ".yaml" || path.substr(path.size() - 4) == ".yml"))
        {
            file_config = yamlFileToJson(path);
        }
        else
        {
            std::ifstream in(path);
            if (!in.good())
            {
                Logger::warn("Cannot open configuration file: " + path);
                return false;
            }
            file_config = nlohmann::json::parse(in);
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    applyPatch(defaultConfig());
    if (file_config.is_object())
    {
        applyPatch(file_config);
    }
    loaded_path_ = path;
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

std::string PocoConfigManager::getLoadedPath() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_path_;
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten and set values; arrays are stored as their JSON text
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
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt64(prefix, node.get<int64_t>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
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
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::vector<std::string> PocoConfigManager::getStringList(const std::string &key, const std::vector<std::string> &def) const
{
    std::string raw = getString(key, "");
    if (raw.empty())
        return def;

    try
    {
        auto parsed = nlohmann::json::parse(raw);
        if (!parsed.is_array())
            return def;
        std::vector<std::string> values;
        for (const auto &item : parsed)
        {
            if (item.is_string())
                values.push_back(item.get<std::string>());
        }
        return values;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Configuration key " + key + " is not a list: " + e.what());
        return def;
    }
}

WatcherSettings PocoConfigManager::getWatcherSettings() const
{
    WatcherSettings settings;
    settings.download_folder = getString("watcher.download_folder", "");
    settings.recursive = getBool("watcher.recursive", true);
    settings.min_file_size_bytes = static_cast<uint64_t>(std::max(0, getInt("watcher.min_file_size_mb", 500))) * 1024 * 1024;
    settings.stable_time_ms = getInt("watcher.stable_time_seconds", 30) * 1000;
    settings.supported_extensions = getStringList("watcher.supported_extensions", settings.supported_extensions);
    settings.exclude_patterns = getStringList("watcher.exclude_patterns", settings.exclude_patterns);
    settings.event_source = getString("watcher.event_source", "inotify");
    settings.poll_interval_ms = getInt("watcher.poll_interval_seconds", 5) * 1000;
    settings.scan_on_start = getBool("watcher.scan_on_start", false);
    settings.sampler_threads = getInt("watcher.sampler_threads", 4);
    return settings;
}

NetworkShareSettings PocoConfigManager::getNetworkShareSettings() const
{
    NetworkShareSettings settings;
    settings.mount_path = getString("network_share.mount_path", "");
    settings.target_folder = getString("network_share.target_folder", "Movies");
    settings.verify_mount = getBool("network_share.verify_mount", true);
    return settings;
}

RenamerSettings PocoConfigManager::getRenamerSettings() const
{
    RenamerSettings settings;
    settings.enabled = getBool("mnamer.enabled", true);
    settings.executable_path = getString("mnamer.executable_path", "mnamer");
    settings.batch_mode = getBool("mnamer.batch_mode", true);
    settings.media_type = getString("mnamer.media_type", "movie");
    settings.movie_format = getString("mnamer.movie_format", "{name} ({year})");
    settings.extra_args = getStringList("mnamer.extra_args", settings.extra_args);
    settings.timeout_seconds = getInt("mnamer.timeout_seconds", 60);
    return settings;
}

VersionDetectionSettings PocoConfigManager::getVersionDetectionSettings() const
{
    VersionDetectionSettings settings;
    settings.enabled = getBool("version_detection.enabled", true);
    settings.format = getString("version_detection.format", ".v{number}");
    settings.check_similar = getBool("version_detection.check_similar", true);
    settings.similarity_threshold = getDouble("version_detection.similarity_threshold", 0.9);
    return settings;
}

TransferSettings PocoConfigManager::getTransferSettings() const
{
    TransferSettings settings;
    settings.chunk_size_bytes = static_cast<size_t>(getInt("transfer.chunk_size_bytes", 1048576));
    settings.max_attempts = getInt("transfer.max_attempts", 3);
    settings.backoff_base_ms = getInt("transfer.backoff_base_ms", 1000);
    settings.max_backoff_ms = getInt("transfer.max_backoff_ms", 30000);
    settings.verify_checksum = getBool("transfer.verify_checksum", false);
    settings.max_concurrent = getInt("transfer.max_concurrent", 2);
    return settings;
}

CoordinatorSettings PocoConfigManager::getCoordinatorSettings() const
{
    CoordinatorSettings settings;
    settings.delete_source_on_approve = getBool("coordinator.delete_source_on_approve", false);
    settings.delete_source_on_reject = getBool("coordinator.delete_source_on_reject", true);
    return settings;
}

DatabaseSettings PocoConfigManager::getDatabaseSettings() const
{
    DatabaseSettings settings;
    settings.path = getString("database.path", "moviecp.db");
    settings.busy_timeout_ms = getInt("database.busy_timeout_ms", 30000);
    return settings;
}

WebSettings PocoConfigManager::getWebSettings() const
{
    WebSettings settings;
    settings.host = getString("web.host", "0.0.0.0");
    settings.port = getInt("web.port", 8080);
    return settings;
}

LoggingSettings PocoConfigManager::getLoggingSettings() const
{
    LoggingSettings settings;
    settings.level = getString("logging.level", "INFO");
    settings.file = getString("logging.file", "");
    settings.max_size_mb = getInt("logging.max_size_mb", 10);
    settings.backup_count = getInt("logging.backup_count", 5);
    return settings;
}

bool PocoConfigManager::validateConfig(std::vector<std::string> &errors) const
{
    auto version = getVersionDetectionSettings();
    if (version.similarity_threshold < 0.0 || version.similarity_threshold > 1.0)
        errors.push_back("version_detection.similarity_threshold must be within [0, 1]");
    if (version.format.find("{number}") == std::string::npos)
        errors.push_back("version_detection.format must contain {number}");

    auto transfer = getTransferSettings();
    if (transfer.chunk_size_bytes == 0 || getInt("transfer.chunk_size_bytes", 1048576) <= 0)
        errors.push_back("transfer.chunk_size_bytes must be positive");
    if (transfer.max_attempts < 1)
        errors.push_back("transfer.max_attempts must be at least 1");
    if (transfer.max_concurrent < 1)
        errors.push_back("transfer.max_concurrent must be at least 1");

    auto watcher = getWatcherSettings();
    if (getInt("watcher.min_file_size_mb", 500) < 0)
        errors.push_back("watcher.min_file_size_mb must not be negative");
    if (watcher.stable_time_ms < 0)
        errors.push_back("watcher.stable_time_seconds must not be negative");
    if (watcher.poll_interval_ms <= 0)
        errors.push_back("watcher.poll_interval_seconds must be positive");
    if (watcher.sampler_threads < 1)
        errors.push_back("watcher.sampler_threads must be at least 1");
    if (watcher.event_source != "inotify" && watcher.event_source != "polling")
        errors.push_back("watcher.event_source must be 'inotify' or 'polling'");

    auto web = getWebSettings();
    if (web.port <= 0 || web.port > 65535)
        errors.push_back("web.port must be within 1-65535");

    return errors.empty();
}
