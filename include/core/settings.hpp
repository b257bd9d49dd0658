#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct WatcherSettings
{
    std::string download_folder;
    bool recursive = true;
    uint64_t min_file_size_bytes = 500ULL * 1024 * 1024;
    int stable_time_ms = 30000;
    std::vector<std::string> supported_extensions = {".mkv", ".mp4", ".avi", ".m4v", ".mov", ".wmv", ".flv"};
    std::vector<std::string> exclude_patterns = {"*.part", "*.tmp", "*.downloading"};
    std::string event_source = "inotify"; // inotify | polling
    int poll_interval_ms = 5000;
    bool scan_on_start = false;
    int sampler_threads = 4;
};

struct NetworkShareSettings
{
    std::string mount_path;
    std::string target_folder = "Movies";
    bool verify_mount = true;
};

struct RenamerSettings
{
    bool enabled = true;
    std::string executable_path = "mnamer";
    bool batch_mode = true;
    std::string media_type = "movie";
    std::string movie_format = "{name} ({year})";
    std::vector<std::string> extra_args = {"--no-cache"};
    int timeout_seconds = 60;
};

struct VersionDetectionSettings
{
    bool enabled = true;
    std::string format = ".v{number}";
    bool check_similar = true;
    double similarity_threshold = 0.9;
};

struct TransferSettings
{
    size_t chunk_size_bytes = 1024 * 1024;
    int max_attempts = 3;
    int backoff_base_ms = 1000;
    int max_backoff_ms = 30000;
    bool verify_checksum = false;
    int max_concurrent = 2;
};

struct CoordinatorSettings
{
    bool delete_source_on_approve = false;
    bool delete_source_on_reject = true;
};

struct DatabaseSettings
{
    std::string path = "moviecp.db";
    int busy_timeout_ms = 30000;
};

struct WebSettings
{
    std::string host = "0.0.0.0";
    int port = 8080;
};

struct LoggingSettings
{
    std::string level = "INFO";
    std::string file;
    int max_size_mb = 10;
    int backup_count = 5;
};
