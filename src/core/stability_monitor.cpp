#include "core/stability_monitor.hpp"
#include "database/state_store.hpp"
#include "logging/logger.hpp"
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <vector>

StabilityMonitor::StabilityMonitor(const WatcherSettings &settings, StateStore &store,
                                   std::unique_ptr<FileEventSource> source)
    : settings_(settings), store_(store), source_(std::move(source)), next_generation_(1),
      running_(false), stable_count_(0), sampler_pool_("stability-sampler", settings.sampler_threads)
{
}

StabilityMonitor::~StabilityMonitor()
{
    stop();
}

void StabilityMonitor::setFatalErrorHandler(FatalErrorCallback handler)
{
    fatal_handler_ = std::move(handler);
}

void StabilityMonitor::setStableCallback(StableCallback callback)
{
    stable_callback_ = std::move(callback);
}

bool StabilityMonitor::start()
{
    if (running_.load())
        return true;

    running_ = true;
    timer_thread_ = std::thread(&StabilityMonitor::timerLoop, this);

    if (source_)
    {
        bool started = source_->start(
            [this](const FileEvent &event)
            { notify(event.path); },
            [this](const std::string &message)
            {
                Logger::error("Stability monitor lost its event source: " + message);
                if (fatal_handler_)
                    fatal_handler_(message);
            });
        if (!started)
        {
            Logger::error("Failed to start file event source for " + settings_.download_folder);
            stop();
            return false;
        }
    }

    Logger::info("Stability monitor started on " + settings_.download_folder +
                 " (quiescence " + std::to_string(settings_.stable_time_ms) + "ms, minimum " +
                 FileUtils::formatFileSize(settings_.min_file_size_bytes) + ")");
    return true;
}

void StabilityMonitor::stop()
{
    if (source_)
    {
        source_->stop();
    }
    {
        std::lock_guard<std::mutex> lock(windows_mutex_);
        running_ = false;
    }
    windows_cv_.notify_all();
    if (timer_thread_.joinable())
    {
        timer_thread_.join();
    }
    sampler_pool_.waitForIdle();
}

bool StabilityMonitor::passesFilters(const std::string &path) const
{
    std::error_code ec;
    if (fs::is_directory(path, ec))
        return false;

    if (!FileUtils::hasAllowedExtension(path, settings_.supported_extensions))
        return false;

    const std::string name = fs::path(path).filename().string();
    for (const auto &pattern : settings_.exclude_patterns)
    {
        if (FileUtils::matchesGlob(pattern, name))
            return false;
    }
    return true;
}

void StabilityMonitor::notify(const std::string &path)
{
    if (!passesFilters(path))
    {
        Logger::trace("Ignoring " + path);
        return;
    }

    Window window;
    auto meta = FileUtils::getFileMetadata(path);
    if (meta)
    {
        window.baseline_size = meta->file_size;
        window.baseline_valid = true;
    }
    window.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings_.stable_time_ms);
    window.generation = next_generation_.fetch_add(1);

    {
        std::lock_guard<std::mutex> lock(windows_mutex_);
        windows_[path] = window;
    }
    windows_cv_.notify_all();
}

size_t StabilityMonitor::scanExisting()
{
    std::vector<std::string> files;
    FileUtils::listFilesAsObservable(settings_.download_folder, settings_.recursive).subscribe([&files](const std::string &path)
                                                                                               { files.push_back(path); });

    std::atomic<size_t> accepted{0};
    tbb::parallel_for(tbb::blocked_range<size_t>(0, files.size()),
                      [&](const tbb::blocked_range<size_t> &range)
                      {
                          for (size_t i = range.begin(); i != range.end(); ++i)
                          {
                              if (passesFilters(files[i]))
                              {
                                  notify(files[i]);
                                  accepted.fetch_add(1);
                              }
                          }
                      });

    Logger::info("Initial scan queued " + std::to_string(accepted.load()) + " of " +
                 std::to_string(files.size()) + " files in " + settings_.download_folder);
    return accepted.load();
}

size_t StabilityMonitor::trackedCount() const
{
    std::lock_guard<std::mutex> lock(windows_mutex_);
    return windows_.size();
}

void StabilityMonitor::timerLoop()
{
    std::unique_lock<std::mutex> lock(windows_mutex_);
    while (running_.load())
    {
        auto now = std::chrono::steady_clock::now();
        auto next_deadline = now + std::chrono::seconds(1);

        std::vector<std::pair<std::string, Window>> expired;
        for (auto it = windows_.begin(); it != windows_.end();)
        {
            if (it->second.deadline <= now)
            {
                expired.emplace_back(it->first, it->second);
                it = windows_.erase(it);
            }
            else
            {
                if (it->second.deadline < next_deadline)
                    next_deadline = it->second.deadline;
                ++it;
            }
        }

        if (!expired.empty())
        {
            lock.unlock();
            for (auto &[path, window] : expired)
            {
                sampler_pool_.submit([this, path = path, window = window]
                                     { evaluate(path, window); });
            }
            lock.lock();
            continue;
        }

        windows_cv_.wait_until(lock, next_deadline);
    }
}

void StabilityMonitor::evaluate(const std::string &path, const Window &window)
{
    {
        // A notification after expiry opened a newer window; let that one decide
        std::lock_guard<std::mutex> lock(windows_mutex_);
        auto it = windows_.find(path);
        if (it != windows_.end() && it->second.generation > window.generation)
            return;
    }

    auto meta = FileUtils::getFileMetadata(path);
    if (!meta)
    {
        Logger::debug("File vanished or unreadable before it was stable: " + path);
        return;
    }
    if (!window.baseline_valid || meta->file_size != window.baseline_size)
    {
        Logger::debug("File still changing: " + path + " (" + std::to_string(window.baseline_size) +
                      " -> " + std::to_string(meta->file_size) + " bytes)");
        return;
    }
    if (meta->file_size < settings_.min_file_size_bytes)
    {
        Logger::debug("File below minimum size: " + path + " (" + FileUtils::formatFileSize(meta->file_size) + ")");
        return;
    }

    onStable(path, *meta);
}

void StabilityMonitor::onStable(const std::string &path, const FileMetadata &metadata)
{
    std::error_code ec;
    fs::path absolute_path = fs::absolute(path, ec);
    PendingEntry entry;
    entry.original_path = (ec ? fs::path(path) : absolute_path).lexically_normal().string();
    entry.original_filename = fs::path(path).filename().string();
    entry.file_size_bytes = metadata.file_size;
    entry.file_metadata = FileUtils::metadataToJson(metadata);

    auto [result, inserted] = store_.insertPending(entry);
    if (!result.success)
    {
        Logger::error("Failed to record stable file " + path + ": " + result.error_message);
        return;
    }
    if (!inserted)
    {
        Logger::debug("Pending entry already exists for " + entry.original_path);
        return;
    }

    stable_count_.fetch_add(1);
    Logger::info("New movie ready: " + entry.original_filename + " (" +
                 FileUtils::formatFileSize(metadata.file_size) + ")");
    if (stable_callback_)
        stable_callback_(entry.original_path, metadata);
}
