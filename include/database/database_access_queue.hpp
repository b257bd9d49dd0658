#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

class StateStore;

struct WriteOperationResult
{
    bool success;
    std::string error_message;

    WriteOperationResult(bool s = true, const std::string &msg = "")
        : success(s), error_message(msg) {}

    static WriteOperationResult Failure(const std::string &msg = "")
    {
        return WriteOperationResult(false, msg);
    }
};

using WriteOperation = std::function<WriteOperationResult(StateStore &)>;
using ReadOperation = std::function<std::any(StateStore &)>;

/**
 * @brief Runs every statement of one StateStore on a single access thread
 *
 * The SQLite connection is only ever touched from this thread, so callers
 * in the transfer pool, the HTTP server and the watcher never share it.
 * Operations run in submission order.
 */
class DatabaseAccessQueue
{
public:
    /**
     * @param store Store whose connection the access thread owns
     */
    explicit DatabaseAccessQueue(StateStore &store);
    ~DatabaseAccessQueue();

    DatabaseAccessQueue(const DatabaseAccessQueue &) = delete;
    DatabaseAccessQueue &operator=(const DatabaseAccessQueue &) = delete;

    /**
     * @brief Enqueue a write and block until the access thread has run it
     */
    WriteOperationResult executeWrite(WriteOperation operation);

    std::future<std::any> enqueueRead(ReadOperation operation);

    // Block until the queue is empty and nothing is running
    void wait_for_completion(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Drain queued operations, then stop the access thread
    void stop();

private:
    struct QueuedOperation
    {
        ReadOperation operation;
        std::promise<std::any> promise;
    };

    void access_thread_worker();
    bool idle() const { return operation_queue_.empty() && !busy_; }

    StateStore &store_;
    std::queue<QueuedOperation> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread access_thread_;
    bool should_stop_;
    bool busy_;
};
