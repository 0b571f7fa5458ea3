#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown state for the server mode.
 * - SIGINT/SIGTERM/SIGQUIT only set sig_atomic_t flags; a watcher thread turns them into a request
 * - waitForShutdown() blocks the main thread until a request arrives
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Not for use inside a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    // Returns true if shutdown was requested before the timeout
    bool waitForShutdown(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Test helper
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
