#pragma once

#include "core/file_event_source.hpp"
#include "core/file_utils.hpp"
#include "core/settings.hpp"
#include "core/bounded_task_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

class StateStore;

/**
 * @brief Decides when a file in the download folder has stopped growing
 *
 * Each notification for a path (re)arms a debounce window holding the size
 * seen at that moment. When a window expires without further notifications
 * the path is re-sampled on the sampler pool: same size, still present and
 * at least the minimum size means stable, and a pending entry is recorded.
 * Anything else is dropped silently until the next notification.
 */
class StabilityMonitor
{
public:
    using StableCallback = std::function<void(const std::string &path, const FileMetadata &metadata)>;
    using FatalErrorCallback = std::function<void(const std::string &message)>;

    /**
     * @param settings Filters, quiescence window and sampler thread count
     * @param store Store receiving pending entries
     * @param source Event producer; may be null when events are injected with notify()
     */
    StabilityMonitor(const WatcherSettings &settings, StateStore &store, std::unique_ptr<FileEventSource> source);
    ~StabilityMonitor();

    StabilityMonitor(const StabilityMonitor &) = delete;
    StabilityMonitor &operator=(const StabilityMonitor &) = delete;

    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Feed one notification for a path through filtering and the debounce window
     */
    void notify(const std::string &path);

    /**
     * @brief Notify every file already under the download folder
     * @return Number of files that passed the filters
     */
    size_t scanExisting();

    /**
     * @brief Extension allow-list, exclusion globs and directory check
     */
    bool passesFilters(const std::string &path) const;

    void setFatalErrorHandler(FatalErrorCallback handler);

    // Observer for stable files, called after the store insert
    void setStableCallback(StableCallback callback);

    size_t trackedCount() const;
    size_t stableCount() const { return stable_count_.load(); }

private:
    struct Window
    {
        uint64_t baseline_size = 0;
        bool baseline_valid = false;
        std::chrono::steady_clock::time_point deadline;
        uint64_t generation = 0;
    };

    void timerLoop();
    void evaluate(const std::string &path, const Window &window);
    void onStable(const std::string &path, const FileMetadata &metadata);

    WatcherSettings settings_;
    StateStore &store_;
    std::unique_ptr<FileEventSource> source_;

    mutable std::mutex windows_mutex_;
    std::condition_variable windows_cv_;
    std::unordered_map<std::string, Window> windows_;
    std::atomic<uint64_t> next_generation_;

    std::thread timer_thread_;
    std::atomic<bool> running_;
    std::atomic<size_t> stable_count_;

    BoundedTaskPool sampler_pool_;

    FatalErrorCallback fatal_handler_;
    StableCallback stable_callback_;
};
