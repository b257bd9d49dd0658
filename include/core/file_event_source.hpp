#pragma once

#include "core/file_utils.hpp"
#include "core/settings.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

enum class FileEventType
{
    CREATED,
    MODIFIED,
    CLOSED_WRITE,
    MOVED_IN,
    SCANNED
};

struct FileEvent
{
    std::string path;
    FileEventType type = FileEventType::MODIFIED;
};

/**
 * @brief Producer of file-system notifications for the stability monitor
 *
 * Implementations deliver events from their own thread. A fatal error means
 * events may have been lost for good; the source stops after reporting it.
 */
class FileEventSource
{
public:
    using EventCallback = std::function<void(const FileEvent &)>;
    using ErrorCallback = std::function<void(const std::string &)>;

    virtual ~FileEventSource() = default;

    virtual bool start(EventCallback on_event, ErrorCallback on_fatal) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    /**
     * @brief Build the source named by settings.event_source ("inotify" or "polling")
     */
    static std::unique_ptr<FileEventSource> create(const WatcherSettings &settings);
};

/**
 * @brief Linux inotify watcher over a directory tree
 *
 * Directories created after start are watched as they appear, and files
 * already inside them are reported as SCANNED events.
 */
class InotifyEventSource : public FileEventSource
{
public:
    InotifyEventSource(const std::string &root, bool recursive);
    ~InotifyEventSource() override;

    bool start(EventCallback on_event, ErrorCallback on_fatal) override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }

private:
    int addWatch(const std::string &dir_path);
    void addWatchRecursive(const std::string &dir_path, bool report_files);
    void watchLoop();
    void handleEvent(int wd, uint32_t mask, const std::string &name);
    void fail(const std::string &message);

    std::string root_;
    bool recursive_;
    int inotify_fd_;
    int root_wd_;
    std::unordered_map<int, std::string> wd_to_path_;
    EventCallback on_event_;
    ErrorCallback on_fatal_;
    std::thread watcher_thread_;
    std::atomic<bool> running_;
};

/**
 * @brief Periodic scan that reports files whose size or modification time changed
 */
class PollingEventSource : public FileEventSource
{
public:
    PollingEventSource(const std::string &root, bool recursive, int interval_ms);
    ~PollingEventSource() override;

    bool start(EventCallback on_event, ErrorCallback on_fatal) override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }

    // One scan pass; public so tests can drive it without waiting for the timer
    bool pollOnce();

private:
    void pollLoop();

    std::string root_;
    bool recursive_;
    int interval_ms_;
    std::unordered_map<std::string, FileMetadata> snapshot_;
    EventCallback on_event_;
    ErrorCallback on_fatal_;
    std::thread poll_thread_;
    std::atomic<bool> running_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};
