#include "core/bounded_task_pool.hpp"
#include "logging/logger.hpp"

BoundedTaskPool::BoundedTaskPool(const std::string &name, int max_concurrency)
    : name_(name), max_concurrency_(max_concurrency > 0 ? max_concurrency : 1),
      arena_(max_concurrency_, 0), in_flight_(0)
{
    Logger::debug("Task pool '" + name_ + "' created with max concurrency " + std::to_string(max_concurrency_));
}

BoundedTaskPool::~BoundedTaskPool()
{
    waitForIdle();
}

void BoundedTaskPool::submit(std::function<void()> job)
{
    in_flight_.fetch_add(1);
    arena_.enqueue([this, job = std::move(job)]()
                   {
        try
        {
            job();
        }
        catch (const std::exception &e)
        {
            Logger::error("Task in pool '" + name_ + "' failed: " + std::string(e.what()));
        }
        // Notify under the lock so a waiting destructor cannot finish first
        std::lock_guard<std::mutex> lock(idle_mutex_);
        in_flight_.fetch_sub(1);
        idle_cv_.notify_all(); });
}

void BoundedTaskPool::waitForIdle()
{
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this]
                  { return in_flight_.load() == 0; });
}
