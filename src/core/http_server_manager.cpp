#include "core/http_server_manager.hpp"
#include "core/lifecycle_coordinator.hpp"
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"

HttpServerManager::HttpServerManager(LifecycleCoordinator &coordinator) : coordinator_(coordinator)
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

bool HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running on " + current_host_ + ":" +
                     std::to_string(current_port_));
        return true;
    }

    server_ = std::make_unique<httplib::Server>();
    RouteHandlers::setupRoutes(*server_, coordinator_);
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                   {
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception &e)
        {
            Logger::error("HttpServerManager: Unhandled error on " + req.path + ": " + std::string(e.what()));
        }
        res.status = 500;
        res.set_content(json{{"status", "error"}, {"error", "InternalError"}, {"message", "Internal server error"}}.dump(),
                        "application/json"); });

    if (!server_->bind_to_port(host, port))
    {
        Logger::error("HttpServerManager: Failed to bind " + host + ":" + std::to_string(port));
        server_.reset();
        return false;
    }

    current_host_ = host;
    current_port_ = port;
    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on " + host + ":" + std::to_string(port));
    return true;
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (server_)
    {
        server_->stop();
    }

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }

    if (running_.exchange(false))
    {
        Logger::info("HttpServerManager: Server stopped");
    }
    server_.reset();
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_port_;
}

void HttpServerManager::serverThread()
{
    try
    {
        if (!server_->listen_after_bind())
        {
            Logger::error("HttpServerManager: Listener on " + current_host_ + ":" + std::to_string(current_port_) +
                          " exited with an error");
        }
        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
