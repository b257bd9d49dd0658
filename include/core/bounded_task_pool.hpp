#pragma once

#include <tbb/task_arena.h>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief Fire-and-forget jobs on a TBB arena capped at max_concurrency threads
 *
 * Jobs are enqueued, so they make progress even when no other thread joins
 * the arena. Exceptions escaping a job are logged and dropped.
 */
class BoundedTaskPool
{
public:
    BoundedTaskPool(const std::string &name, int max_concurrency);
    ~BoundedTaskPool();

    BoundedTaskPool(const BoundedTaskPool &) = delete;
    BoundedTaskPool &operator=(const BoundedTaskPool &) = delete;

    void submit(std::function<void()> job);

    // Block until every submitted job has finished
    void waitForIdle();

private:
    std::string name_;
    int max_concurrency_;
    tbb::task_arena arena_;
    std::atomic<size_t> in_flight_;
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};
