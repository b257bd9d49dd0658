#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown coordination for the long-running commands.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT
 * - Records why shutdown happened and the exit code the process should return
 * - Provides a blocking wait until shutdown is requested
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Graceful request (signal or operator); exit code stays 0
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    /**
     * @brief Stop because a component can no longer do its job (e.g. lost file events)
     * @param exit_code Non-zero status the process should exit with
     */
    void requestFatalShutdown(const std::string &reason, int exit_code = 1) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until shutdown has been requested
    void waitForShutdown();
    bool waitForShutdownFor(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    int getExitCode() const noexcept { return exit_code_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    // Translates signal flags into a proper shutdown request outside signal context
    void startWatcher();
    void stopWatcher();
    void markRequested(const std::string &reason, int signal_number, int exit_code) noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::atomic<int> exit_code_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
