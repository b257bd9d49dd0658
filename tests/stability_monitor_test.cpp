#include "test_base.hpp"
#include "core/file_event_source.hpp"
#include "core/stability_monitor.hpp"
#include "database/state_store.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

namespace
{
    template <typename Predicate>
    bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }
}

class StabilityMonitorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<StateStore>(getTestDbPath());
        ASSERT_TRUE(store_->isOpen());

        settings_.download_folder = getDownloadsDir();
        settings_.min_file_size_bytes = 1000;
        settings_.stable_time_ms = 200;
        settings_.sampler_threads = 2;
    }

    void TearDown() override
    {
        monitor_.reset();
        store_.reset();
        TestBase::TearDown();
    }

    StabilityMonitor &monitor()
    {
        if (!monitor_)
        {
            monitor_ = std::make_unique<StabilityMonitor>(settings_, *store_, nullptr);
            EXPECT_TRUE(monitor_->start());
        }
        return *monitor_;
    }

    std::unique_ptr<StateStore> store_;
    WatcherSettings settings_;
    std::unique_ptr<StabilityMonitor> monitor_;
};

TEST_F(StabilityMonitorTest, QuietFileBecomesPending)
{
    std::string path = createFile("Heat.1995.mkv", 4096);
    monitor().notify(path);

    ASSERT_TRUE(waitUntil([&]
                          { return monitor().stableCount() == 1; },
                          std::chrono::milliseconds(3000)));
    auto entries = store_->listPending().value;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].original_filename, "Heat.1995.mkv");
    EXPECT_EQ(entries[0].file_size_bytes, 4096u);
    EXPECT_EQ(entries[0].status, PendingStatus::PENDING);
    EXPECT_EQ(entries[0].original_path, fs::path(path).lexically_normal().string());
    EXPECT_NE(entries[0].file_metadata.find(".mkv"), std::string::npos);
}

TEST_F(StabilityMonitorTest, SmallFileIsNeverRecorded)
{
    std::string path = createFile("Sample.mkv", 999);
    monitor().notify(path);

    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(monitor().stableCount(), 0u);
    EXPECT_TRUE(store_->listPending().value.empty());
}

TEST_F(StabilityMonitorTest, FiltersRejectExtensionsAndPatterns)
{
    EXPECT_TRUE(monitor().passesFilters(createFile("Movie.MKV", 10)));
    EXPECT_FALSE(monitor().passesFilters(createFile("notes.txt", 10)));
    EXPECT_FALSE(monitor().passesFilters(createFile("Movie.mkv.part", 10)));
    EXPECT_FALSE(monitor().passesFilters(getDownloadsDir()));

    settings_.exclude_patterns = {"sample*"};
    StabilityMonitor custom(settings_, *store_, nullptr);
    EXPECT_FALSE(custom.passesFilters(createFile("sample-heat.mkv", 10)));
    EXPECT_TRUE(custom.passesFilters(createFile("heat.mkv", 10)));

    std::string text = createFile("readme.txt", 5000);
    monitor().notify(text);
    EXPECT_EQ(monitor().trackedCount(), 0u);
}

TEST_F(StabilityMonitorTest, GrowingFileWaitsForAFullQuietWindow)
{
    std::string path = createFile("Growing.mkv", 2000);
    monitor().notify(path);

    // Grows inside the window without a new notification: the sample disagrees
    appendToFile(path, 2000);
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(monitor().stableCount(), 0u);
    EXPECT_TRUE(store_->listPending().value.empty());

    // Next notification opens a new window; nothing changes during it
    monitor().notify(path);
    ASSERT_TRUE(waitUntil([&]
                          { return monitor().stableCount() == 1; },
                          std::chrono::milliseconds(3000)));
    EXPECT_EQ(store_->listPending().value[0].file_size_bytes, 4000u);
}

TEST_F(StabilityMonitorTest, RepeatedNotificationsDebounce)
{
    settings_.stable_time_ms = 400;
    std::string path = createFile("Debounce.mkv", 2000);
    auto start = std::chrono::steady_clock::now();

    for (int i = 0; i < 5; ++i)
    {
        appendToFile(path, 100);
        monitor().notify(path);
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
    }
    EXPECT_EQ(monitor().trackedCount(), 1u);
    EXPECT_EQ(monitor().stableCount(), 0u);

    ASSERT_TRUE(waitUntil([&]
                          { return monitor().stableCount() == 1; },
                          std::chrono::milliseconds(3000)));
    auto elapsed = std::chrono::steady_clock::now() - start;
    // Last notification lands at about 320ms, so nothing settles before 720ms
    EXPECT_GE(elapsed, std::chrono::milliseconds(700));
    EXPECT_EQ(store_->listPending().value[0].file_size_bytes, 2500u);
}

TEST_F(StabilityMonitorTest, VanishedFileIsDropped)
{
    std::string path = createFile("Gone.mkv", 5000);
    monitor().notify(path);
    fs::remove(path);

    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(monitor().stableCount(), 0u);
    EXPECT_TRUE(store_->listPending().value.empty());
}

TEST_F(StabilityMonitorTest, SameFileIsRecordedOnce)
{
    std::string path = createFile("Once.mkv", 5000);
    monitor().notify(path);
    ASSERT_TRUE(waitUntil([&]
                          { return monitor().stableCount() == 1; },
                          std::chrono::milliseconds(3000)));

    monitor().notify(path);
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(monitor().stableCount(), 1u);
    EXPECT_EQ(store_->listPending().value.size(), 1u);
}

TEST_F(StabilityMonitorTest, ScanExistingQueuesEligibleFiles)
{
    createFile("A.mkv", 5000);
    createFile("nested/B.mp4", 5000);
    createFile("C.nfo", 5000);
    createFile("D.mkv.part", 5000);

    EXPECT_EQ(monitor().scanExisting(), 2u);
    ASSERT_TRUE(waitUntil([&]
                          { return monitor().stableCount() == 2; },
                          std::chrono::milliseconds(3000)));
    EXPECT_EQ(store_->listPending().value.size(), 2u);
}

TEST_F(StabilityMonitorTest, StableCallbackSeesRecordedPath)
{
    std::vector<std::string> seen;
    std::mutex seen_mutex;
    monitor_ = std::make_unique<StabilityMonitor>(settings_, *store_, nullptr);
    monitor_->setStableCallback([&](const std::string &path, const FileMetadata &)
                                {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(path); });
    ASSERT_TRUE(monitor_->start());

    std::string path = createFile("Callback.mkv", 5000);
    monitor_->notify(path);
    ASSERT_TRUE(waitUntil([&]
                          {
        std::lock_guard<std::mutex> lock(seen_mutex);
        return !seen.empty(); },
                          std::chrono::milliseconds(3000)));
    std::lock_guard<std::mutex> lock(seen_mutex);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], store_->listPending().value[0].original_path);
}

TEST_F(StabilityMonitorTest, PollingSourceReportsNewAndChangedFiles)
{
    createFile("existing.mkv", 100);
    PollingEventSource source(getDownloadsDir(), true, 60000);

    std::vector<FileEvent> events;
    std::mutex events_mutex;
    ASSERT_TRUE(source.start([&](const FileEvent &event)
                             {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(event); },
                             [](const std::string &) {}));

    ASSERT_TRUE(source.pollOnce());
    EXPECT_TRUE(events.empty()) << "files present at start are baseline";

    std::string created = createFile("new.mkv", 100);
    appendToFile(getDownloadsDir() + "/existing.mkv", 50);
    ASSERT_TRUE(source.pollOnce());
    source.stop();

    std::lock_guard<std::mutex> lock(events_mutex);
    ASSERT_EQ(events.size(), 2u);
    bool saw_created = false;
    bool saw_modified = false;
    for (const auto &event : events)
    {
        if (event.path == created && event.type == FileEventType::CREATED)
            saw_created = true;
        if (event.type == FileEventType::MODIFIED)
            saw_modified = true;
    }
    EXPECT_TRUE(saw_created);
    EXPECT_TRUE(saw_modified);
}

TEST_F(StabilityMonitorTest, PollingSourceSeesFileReplacedByRename)
{
    std::string existing = createFile("existing.mkv", 100);
    std::string replacement = getTestRoot() + "/replacement.mkv";
    {
        std::ofstream out(replacement, std::ios::binary);
        out << std::string(100, 'z');
    }
    fs::last_write_time(replacement, fs::last_write_time(existing));

    PollingEventSource source(getDownloadsDir(), false, 60000);
    std::vector<FileEvent> events;
    std::mutex events_mutex;
    ASSERT_TRUE(source.start([&](const FileEvent &event)
                             {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(event); },
                             [](const std::string &) {}));
    ASSERT_TRUE(source.pollOnce());

    // Same size and mtime, different inode
    fs::rename(replacement, existing);
    ASSERT_TRUE(source.pollOnce());
    source.stop();

    std::lock_guard<std::mutex> lock(events_mutex);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].path, existing);
    EXPECT_EQ(events[0].type, FileEventType::MODIFIED);
}

TEST_F(StabilityMonitorTest, PollingSourceReportsLostRoot)
{
    PollingEventSource source(getDownloadsDir(), false, 60000);
    std::string fatal;
    ASSERT_TRUE(source.start([](const FileEvent &) {},
                             [&fatal](const std::string &message)
                             { fatal = message; }));

    fs::remove_all(getDownloadsDir());
    EXPECT_FALSE(source.pollOnce());
    source.stop();
    EXPECT_FALSE(fatal.empty());
}

TEST_F(StabilityMonitorTest, InotifySourceSeesNewFile)
{
    settings_.event_source = "inotify";
    auto source = FileEventSource::create(settings_);
    ASSERT_NE(source, nullptr);

    std::atomic<int> matching{0};
    const std::string target = getDownloadsDir() + "/Inotify.mkv";
    ASSERT_TRUE(source->start([&](const FileEvent &event)
                              {
        if (event.path == target)
            matching.fetch_add(1); },
                              [](const std::string &) {}));

    createFile("Inotify.mkv", 100);
    EXPECT_TRUE(waitUntil([&]
                          { return matching.load() > 0; },
                          std::chrono::milliseconds(3000)));
    source->stop();
}
