#pragma once

#include <httplib.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class LifecycleCoordinator;

/**
 * @brief Owns the HTTP server and its listener thread
 *
 * Routes are bound to the coordinator passed in at construction. start()
 * binds the socket before returning, so a port that is already taken is
 * reported to the caller instead of from the listener thread.
 */
class HttpServerManager
{
public:
    explicit HttpServerManager(LifecycleCoordinator &coordinator);
    ~HttpServerManager();

    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    /**
     * @brief Bind to host:port and serve on a background thread
     * @return false if the address could not be bound
     */
    bool start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    int getCurrentPort() const;

private:
    void serverThread();

    LifecycleCoordinator &coordinator_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_ = 0;

    mutable std::mutex server_mutex_;
};
