#include "database/database_access_queue.hpp"
#include "database/state_store.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

DatabaseAccessQueue::DatabaseAccessQueue(StateStore &store)
    : store_(store), should_stop_(false), busy_(false)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

WriteOperationResult DatabaseAccessQueue::executeWrite(WriteOperation operation)
{
    auto future = enqueueRead([operation = std::move(operation)](StateStore &store)
                              { return std::any(operation(store)); });
    try
    {
        return std::any_cast<WriteOperationResult>(future.get());
    }
    catch (const std::exception &e)
    {
        return WriteOperationResult::Failure(e.what());
    }
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    QueuedOperation queued{std::move(operation), std::promise<std::any>()};
    std::future<std::any> future = queued.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (should_stop_)
        {
            queued.promise.set_exception(std::make_exception_ptr(std::runtime_error("Database access queue stopped")));
            return future;
        }
        operation_queue_.push(std::move(queued));
    }
    queue_cv_.notify_all();

    return future;
}

void DatabaseAccessQueue::wait_for_completion(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (!queue_cv_.wait_for(lock, timeout, [this]
                            { return idle(); }))
    {
        Logger::warn("Database access queue still busy after " + std::to_string(timeout.count()) +
                     "ms, waiting for " + std::to_string(operation_queue_.size()) + " queued operation(s)");
        queue_cv_.wait(lock, [this]
                       { return idle(); });
    }
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        QueuedOperation queued;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_; });

            if (operation_queue_.empty())
            {
                break;
            }

            queued = std::move(operation_queue_.front());
            operation_queue_.pop();
            busy_ = true;
        }

        try
        {
            queued.promise.set_value(queued.operation(store_));
        }
        catch (const std::exception &e)
        {
            Logger::error("Database operation failed: " + std::string(e.what()));
            queued.promise.set_exception(std::current_exception());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
        }
        queue_cv_.notify_all();
    }
}
