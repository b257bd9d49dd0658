#include "core/file_event_source.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace
{
    constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE_SELF;
    constexpr int POLL_TIMEOUT_MS = 200;
}

std::unique_ptr<FileEventSource> FileEventSource::create(const WatcherSettings &settings)
{
    if (settings.event_source == "polling")
    {
        return std::make_unique<PollingEventSource>(settings.download_folder, settings.recursive, settings.poll_interval_ms);
    }
    return std::make_unique<InotifyEventSource>(settings.download_folder, settings.recursive);
}

// --- InotifyEventSource ---

InotifyEventSource::InotifyEventSource(const std::string &root, bool recursive)
    : root_(root), recursive_(recursive), inotify_fd_(-1), root_wd_(-1), running_(false)
{
}

InotifyEventSource::~InotifyEventSource()
{
    stop();
}

bool InotifyEventSource::start(EventCallback on_event, ErrorCallback on_fatal)
{
    if (running_.load())
        return true;

    if (!FileUtils::isValidDirectory(root_))
    {
        Logger::error("Watch directory does not exist: " + root_);
        return false;
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0)
    {
        Logger::error("Failed to initialize inotify: " + std::string(std::strerror(errno)));
        return false;
    }

    on_event_ = std::move(on_event);
    on_fatal_ = std::move(on_fatal);

    root_wd_ = addWatch(root_);
    if (root_wd_ < 0)
    {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        return false;
    }
    if (recursive_)
    {
        addWatchRecursive(root_, false);
    }

    running_ = true;
    watcher_thread_ = std::thread(&InotifyEventSource::watchLoop, this);
    Logger::info("inotify watching " + root_ + " (" + std::to_string(wd_to_path_.size()) + " directories)");
    return true;
}

void InotifyEventSource::stop()
{
    running_ = false;
    if (watcher_thread_.joinable())
    {
        watcher_thread_.join();
    }
    if (inotify_fd_ >= 0)
    {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    wd_to_path_.clear();
}

int InotifyEventSource::addWatch(const std::string &dir_path)
{
    int wd = inotify_add_watch(inotify_fd_, dir_path.c_str(), WATCH_MASK);
    if (wd < 0)
    {
        Logger::warn("Failed to watch " + dir_path + ": " + std::string(std::strerror(errno)));
        return -1;
    }
    wd_to_path_[wd] = dir_path;
    return wd;
}

void InotifyEventSource::addWatchRecursive(const std::string &dir_path, bool report_files)
{
    std::error_code ec;
    fs::recursive_directory_iterator it(dir_path, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec))
    {
        std::error_code type_ec;
        if (it->is_directory(type_ec))
        {
            addWatch(it->path().string());
        }
        else if (report_files && it->is_regular_file(type_ec) && on_event_)
        {
            on_event_(FileEvent{it->path().string(), FileEventType::SCANNED});
        }
    }
}

void InotifyEventSource::watchLoop()
{
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (running_.load())
    {
        struct pollfd pfd;
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            fail("poll on inotify descriptor failed: " + std::string(std::strerror(errno)));
            return;
        }
        if (ready == 0)
            continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        {
            fail("inotify descriptor reported an error");
            return;
        }

        ssize_t len = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (len < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            fail("read on inotify descriptor failed: " + std::string(std::strerror(errno)));
            return;
        }

        for (char *ptr = buffer; ptr < buffer + len;)
        {
            const struct inotify_event *event = reinterpret_cast<const struct inotify_event *>(ptr);
            std::string name = event->len > 0 ? std::string(event->name) : std::string();
            handleEvent(event->wd, event->mask, name);
            if (!running_.load())
                return;
            ptr += sizeof(struct inotify_event) + event->len;
        }
    }
}

void InotifyEventSource::handleEvent(int wd, uint32_t mask, const std::string &name)
{
    if (mask & IN_Q_OVERFLOW)
    {
        // Kernel queue overflowed; rescan so nothing in flight is missed
        Logger::warn("inotify queue overflow, rescanning " + root_);
        addWatchRecursive(root_, true);
        return;
    }

    if ((mask & (IN_IGNORED | IN_DELETE_SELF)) && wd == root_wd_)
    {
        fail("Watch on root directory " + root_ + " was removed");
        return;
    }
    if (mask & IN_IGNORED)
    {
        wd_to_path_.erase(wd);
        return;
    }

    auto it = wd_to_path_.find(wd);
    if (it == wd_to_path_.end() || name.empty())
        return;

    std::string full_path = it->second + "/" + name;

    if (mask & IN_ISDIR)
    {
        if (recursive_ && (mask & (IN_CREATE | IN_MOVED_TO)))
        {
            Logger::debug("Watching new directory: " + full_path);
            addWatch(full_path);
            // Files may have landed before the watch existed
            addWatchRecursive(full_path, true);
        }
        return;
    }

    FileEventType type = FileEventType::MODIFIED;
    if (mask & IN_CREATE)
        type = FileEventType::CREATED;
    else if (mask & IN_CLOSE_WRITE)
        type = FileEventType::CLOSED_WRITE;
    else if (mask & IN_MOVED_TO)
        type = FileEventType::MOVED_IN;

    if (on_event_)
        on_event_(FileEvent{full_path, type});
}

void InotifyEventSource::fail(const std::string &message)
{
    Logger::error("File event delivery lost: " + message);
    running_ = false;
    if (on_fatal_)
        on_fatal_(message);
}

// --- PollingEventSource ---

PollingEventSource::PollingEventSource(const std::string &root, bool recursive, int interval_ms)
    : root_(root), recursive_(recursive), interval_ms_(interval_ms > 0 ? interval_ms : 1000), running_(false)
{
}

PollingEventSource::~PollingEventSource()
{
    stop();
}

bool PollingEventSource::start(EventCallback on_event, ErrorCallback on_fatal)
{
    if (running_.load())
        return true;
    if (!FileUtils::isValidDirectory(root_))
    {
        Logger::error("Watch directory does not exist: " + root_);
        return false;
    }

    on_event_ = std::move(on_event);
    on_fatal_ = std::move(on_fatal);

    // Baseline without events; files present at start are handled by scan_on_start
    snapshot_.clear();
    FileUtils::listFilesAsObservable(root_, recursive_).subscribe([this](const std::string &path)
                                                                  {
        auto meta = FileUtils::getFileMetadata(path);
        if (meta)
            snapshot_[path] = *meta; });

    running_ = true;
    poll_thread_ = std::thread(&PollingEventSource::pollLoop, this);
    Logger::info("Polling " + root_ + " every " + std::to_string(interval_ms_) + "ms");
    return true;
}

void PollingEventSource::stop()
{
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        running_ = false;
    }
    stop_cv_.notify_all();
    if (poll_thread_.joinable())
    {
        poll_thread_.join();
    }
}

bool PollingEventSource::pollOnce()
{
    bool listed = false;
    std::string list_error;
    std::unordered_map<std::string, FileMetadata> current;

    FileUtils::listFilesAsObservable(root_, recursive_)
        .subscribe([&current](const std::string &path)
                   {
                       auto meta = FileUtils::getFileMetadata(path);
                       if (meta)
                           current[path] = *meta; },
                   [&list_error](const std::exception &e)
                   { list_error = e.what(); },
                   [&listed]()
                   { listed = true; });

    if (!listed)
    {
        if (on_fatal_)
            on_fatal_("Watch root unreachable: " + (list_error.empty() ? root_ : list_error));
        return false;
    }

    for (const auto &[path, meta] : current)
    {
        auto it = snapshot_.find(path);
        if (it == snapshot_.end())
        {
            if (on_event_)
                on_event_(FileEvent{path, FileEventType::CREATED});
        }
        else if (it->second != meta)
        {
            if (on_event_)
                on_event_(FileEvent{path, FileEventType::MODIFIED});
        }
    }
    snapshot_ = std::move(current);
    return true;
}

void PollingEventSource::pollLoop()
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(stop_mutex_);
            if (stop_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_), [this]
                                  { return !running_.load(); }))
            {
                return;
            }
        }
        if (!pollOnce())
        {
            Logger::error("Polling stopped: watch root " + root_ + " unreachable");
            running_ = false;
            return;
        }
    }
}
