#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <csignal>
#include <cstring>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGQUIT, &action, nullptr);

    // A dropped HTTP client must not kill the coordinator
    std::signal(SIGPIPE, SIG_IGN);

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::markRequested(const std::string &reason, int signal_number, int exit_code) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_ = reason;
        last_signal_.store(signal_number);
        exit_code_.store(exit_code);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_requested_.load())
    {
        return;
    }
    markRequested(reason, signal_number, 0);

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }
}

void ShutdownManager::requestFatalShutdown(const std::string &reason, int exit_code) noexcept
{
    if (shutdown_requested_.load())
    {
        return;
    }
    markRequested(reason, 0, exit_code == 0 ? 1 : exit_code);
    Logger::error("ShutdownManager: fatal shutdown - " + reason);
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdownFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    last_signal_.store(0);
    exit_code_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
}
