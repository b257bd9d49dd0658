#include "core/file_event_source.hpp"
#include "core/file_utils.hpp"
#include "core/http_server_manager.hpp"
#include "core/lifecycle_coordinator.hpp"
#include "core/poco_config_manager.hpp"
#include "core/rename_resolver.hpp"
#include "core/shutdown_manager.hpp"
#include "core/stability_monitor.hpp"
#include "core/transfer_engine.hpp"
#include "core/version_resolver.hpp"
#include "database/state_store.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILURE_STATUS = 1;
    constexpr int EXIT_USAGE = 2;

    void printUsage(const char *program)
    {
        std::cout << "MovieCP - movie download ingestion pipeline" << std::endl;
        std::cout << "Usage: " << program << " [-c <config>] <command> [args]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  watch             Watch the download folder and record stable files" << std::endl;
        std::cout << "  serve             Run the approval HTTP API" << std::endl;
        std::cout << "  init-db           Create the database schema" << std::endl;
        std::cout << "  list              List pending movies" << std::endl;
        std::cout << "  history [limit]   List processed movies, newest first (default 50)" << std::endl;
        std::cout << "  approve <id>      Rename, version and copy a pending movie" << std::endl;
        std::cout << "  reject <id>       Reject a pending movie" << std::endl;
        std::cout << "  stats             Show counts per status" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c      Configuration file (JSON or YAML)" << std::endl;
        std::cout << "  --delete-source   Delete the downloaded file after approve or reject" << std::endl;
        std::cout << "  --keep-source     Keep the downloaded file after approve or reject" << std::endl;
        std::cout << "  --help, -h        Show this help message" << std::endl;
    }

    bool parseId(const std::string &text, int64_t &id)
    {
        try
        {
            size_t consumed = 0;
            id = std::stoll(text, &consumed);
            return consumed == text.size() && id > 0;
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    /**
     * Everything a coordinator process needs, built once and handed to the
     * CLI or HTTP adapter.
     */
    struct CoordinatorStack
    {
        std::unique_ptr<StateStore> store;
        std::unique_ptr<RenameResolver> renamer;
        std::unique_ptr<VersionResolver> versions;
        std::unique_ptr<TransferEngine> engine;
        std::unique_ptr<LifecycleCoordinator> coordinator;
    };

    std::unique_ptr<StateStore> openStore(const PocoConfigManager &config)
    {
        DatabaseSettings db = config.getDatabaseSettings();
        auto store = std::make_unique<StateStore>(db.path, db.busy_timeout_ms);
        if (!store->isOpen())
        {
            Logger::error("Could not open database " + db.path);
            return nullptr;
        }
        return store;
    }

    bool buildCoordinator(const PocoConfigManager &config, CoordinatorStack &stack)
    {
        stack.store = openStore(config);
        if (!stack.store)
            return false;

        NetworkShareSettings share = config.getNetworkShareSettings();
        TransferSettings transfer = config.getTransferSettings();
        if (share.mount_path.empty())
        {
            Logger::error("network_share.mount_path is not configured");
            return false;
        }

        stack.renamer = RenameResolver::create(config.getRenamerSettings());
        stack.versions = std::make_unique<VersionResolver>(config.getVersionDetectionSettings());
        stack.engine = std::make_unique<TransferEngine>(transfer, share.mount_path, share.verify_mount);
        stack.coordinator = std::make_unique<LifecycleCoordinator>(*stack.store, *stack.renamer, *stack.versions,
                                                                   *stack.engine, share, config.getCoordinatorSettings(),
                                                                   transfer.max_concurrent);
        return true;
    }

    int runWatch(const PocoConfigManager &config)
    {
        WatcherSettings watcher = config.getWatcherSettings();
        if (!FileUtils::isValidDirectory(watcher.download_folder))
        {
            Logger::error("Download folder does not exist or is not a directory: " + watcher.download_folder);
            return EXIT_FAILURE_STATUS;
        }

        auto store = openStore(config);
        if (!store)
            return EXIT_FAILURE_STATUS;

        auto &shutdown = ShutdownManager::getInstance();
        shutdown.installSignalHandlers();

        StabilityMonitor monitor(watcher, *store, FileEventSource::create(watcher));
        monitor.setFatalErrorHandler([&shutdown](const std::string &message)
                                     { shutdown.requestFatalShutdown("File events lost: " + message); });
        monitor.setStableCallback([](const std::string &path, const FileMetadata &metadata)
                                  { Logger::debug("Stable: " + path + " (" + FileUtils::formatFileSize(metadata.file_size) + ")"); });

        if (!monitor.start())
        {
            Logger::error("Could not start watching " + watcher.download_folder);
            return EXIT_FAILURE_STATUS;
        }

        if (watcher.scan_on_start)
        {
            size_t queued = monitor.scanExisting();
            Logger::info("Startup scan queued " + std::to_string(queued) + " existing file(s)");
        }

        Logger::info("Watching " + watcher.download_folder + " (PID: " + std::to_string(getpid()) + ")");
        shutdown.waitForShutdown();
        Logger::info("Stopping watcher: " + shutdown.getReason());

        monitor.stop();
        store->waitForWrites();
        return shutdown.getExitCode();
    }

    int runServe(const PocoConfigManager &config)
    {
        CoordinatorStack stack;
        if (!buildCoordinator(config, stack))
            return EXIT_FAILURE_STATUS;

        auto &shutdown = ShutdownManager::getInstance();
        shutdown.installSignalHandlers();

        WebSettings web = config.getWebSettings();
        HttpServerManager server(*stack.coordinator);
        if (!server.start(web.host, web.port))
            return EXIT_FAILURE_STATUS;

        Logger::info("Coordinator ready (PID: " + std::to_string(getpid()) + ")");
        while (!shutdown.waitForShutdownFor(std::chrono::milliseconds(1000)))
        {
            if (!server.isRunning())
            {
                shutdown.requestFatalShutdown("HTTP listener stopped unexpectedly");
            }
        }
        Logger::info("Stopping coordinator: " + shutdown.getReason());

        server.stop();
        // In-flight copies are finished rather than abandoned
        stack.coordinator->waitForIdle();
        return shutdown.getExitCode();
    }

    int runInitDb(const PocoConfigManager &config)
    {
        auto store = openStore(config);
        if (!store)
            return EXIT_FAILURE_STATUS;
        std::cout << "Database initialized at " << store->path() << std::endl;
        return EXIT_OK;
    }

    int reportQueryError(CoordinatorError error, const std::string &message)
    {
        std::cerr << ErrorNames::toString(error) << ": " << message << std::endl;
        return EXIT_FAILURE_STATUS;
    }

    int runList(LifecycleCoordinator &coordinator)
    {
        auto pending = coordinator.listPending();
        if (!pending.ok())
            return reportQueryError(pending.error, pending.message);
        const auto &entries = pending.value;
        if (entries.empty())
        {
            std::cout << "No pending movies" << std::endl;
            return EXIT_OK;
        }

        std::cout << std::left << std::setw(6) << "ID" << std::setw(12) << "STATUS" << std::setw(12) << "SIZE"
                  << std::setw(21) << "DETECTED" << "FILENAME" << std::endl;
        for (const auto &entry : entries)
        {
            std::cout << std::left << std::setw(6) << entry.id << std::setw(12) << MovieStatus::toString(entry.status)
                      << std::setw(12) << FileUtils::formatFileSize(entry.file_size_bytes) << std::setw(21)
                      << entry.detected_at << entry.original_filename << std::endl;
            if (!entry.error_message.empty())
            {
                std::cout << "      last error: " << entry.error_message << std::endl;
            }
        }
        return EXIT_OK;
    }

    int runHistory(LifecycleCoordinator &coordinator, int limit)
    {
        auto history = coordinator.listProcessed(limit);
        if (!history.ok())
            return reportQueryError(history.error, history.message);
        const auto &entries = history.value;
        if (entries.empty())
        {
            std::cout << "No processed movies" << std::endl;
            return EXIT_OK;
        }

        std::cout << std::left << std::setw(6) << "ID" << std::setw(10) << "ACTION" << std::setw(21) << "PROCESSED"
                  << "FILENAME" << std::endl;
        for (const auto &entry : entries)
        {
            std::cout << std::left << std::setw(6) << entry.id << std::setw(10) << MovieStatus::toString(entry.action)
                      << std::setw(21) << entry.processed_at << entry.original_filename;
            if (entry.action == ProcessedAction::APPROVED)
            {
                std::cout << " -> " << entry.final_filename;
            }
            std::cout << std::endl;
        }
        return EXIT_OK;
    }

    int runApprove(LifecycleCoordinator &coordinator, int64_t id, std::optional<bool> delete_source)
    {
        CoordinatorResult result = coordinator.approve(id, delete_source);
        if (!result.ok())
        {
            std::cerr << ErrorNames::toString(result.error) << ": " << result.message << std::endl;
            return EXIT_FAILURE_STATUS;
        }
        if (!result.completed)
        {
            std::cerr << ErrorNames::toString(result.failure_category) << ": " << result.message << std::endl;
            return EXIT_FAILURE_STATUS;
        }
        std::cout << "Copied to " << result.destination_path;
        if (result.version_number > 1)
        {
            std::cout << " (version " << result.version_number << ")";
        }
        std::cout << std::endl;
        return EXIT_OK;
    }

    int runReject(LifecycleCoordinator &coordinator, int64_t id, std::optional<bool> delete_source)
    {
        CoordinatorResult result = coordinator.reject(id, "Rejected by user", delete_source);
        if (!result.ok())
        {
            std::cerr << ErrorNames::toString(result.error) << ": " << result.message << std::endl;
            return EXIT_FAILURE_STATUS;
        }
        std::cout << result.message << std::endl;
        return EXIT_OK;
    }

    int runStats(LifecycleCoordinator &coordinator)
    {
        auto query = coordinator.stats();
        if (!query.ok())
            return reportQueryError(query.error, query.message);
        const MovieStats &stats = query.value;
        std::cout << "Pending:    " << stats.pending_count << std::endl;
        std::cout << "Processing: " << stats.processing_count << std::endl;
        std::cout << "Completed:  " << stats.completed_count << std::endl;
        std::cout << "Failed:     " << stats.failed_count << std::endl;
        std::cout << "Rejected:   " << stats.rejected_count << std::endl;
        return EXIT_OK;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::optional<bool> delete_source;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a file path" << std::endl;
                return EXIT_USAGE;
            }
            config_path = argv[++i];
        }
        else if (arg == "--delete-source")
        {
            delete_source = true;
        }
        else if (arg == "--keep-source")
        {
            delete_source = false;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    PocoConfigManager config;
    if (!config_path.empty())
    {
        if (!config.load(config_path))
        {
            std::cerr << "Error: could not load configuration from " << config_path << std::endl;
            return EXIT_FAILURE_STATUS;
        }
    }
    else if (!config.loadFromSearchPaths())
    {
        Logger::warn("No configuration file found, using defaults");
    }

    LoggingSettings logging = config.getLoggingSettings();
    Logger::init(logging.level, logging.file, logging.max_size_mb, logging.backup_count);

    std::vector<std::string> errors;
    if (!config.validateConfig(errors))
    {
        for (const auto &error : errors)
        {
            Logger::error("Invalid configuration: " + error);
        }
        return EXIT_FAILURE_STATUS;
    }

    const std::string command = positional[0];
    try
    {
        if (command == "watch")
            return runWatch(config);
        if (command == "serve")
            return runServe(config);
        if (command == "init-db")
            return runInitDb(config);

        if (command != "list" && command != "history" && command != "approve" && command != "reject" &&
            command != "stats")
        {
            std::cerr << "Error: unknown command '" << command << "'" << std::endl;
            printUsage(argv[0]);
            return EXIT_USAGE;
        }

        int64_t id = 0;
        int limit = 50;
        if (command == "approve" || command == "reject")
        {
            if (positional.size() < 2 || !parseId(positional[1], id))
            {
                std::cerr << "Error: " << command << " requires a positive numeric id" << std::endl;
                return EXIT_USAGE;
            }
        }
        else if (command == "history" && positional.size() > 1)
        {
            int64_t parsed = 0;
            if (!parseId(positional[1], parsed))
            {
                std::cerr << "Error: history limit must be a positive number" << std::endl;
                return EXIT_USAGE;
            }
            limit = static_cast<int>(parsed);
        }

        CoordinatorStack stack;
        if (!buildCoordinator(config, stack))
            return EXIT_FAILURE_STATUS;
        LifecycleCoordinator &coordinator = *stack.coordinator;

        if (command == "list")
            return runList(coordinator);
        if (command == "history")
            return runHistory(coordinator, limit);
        if (command == "approve")
            return runApprove(coordinator, id, delete_source);
        if (command == "reject")
            return runReject(coordinator, id, delete_source);
        return runStats(coordinator);
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error in '" + command + "': " + std::string(e.what()));
        return EXIT_FAILURE_STATUS;
    }
}
