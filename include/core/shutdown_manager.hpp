#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide cancellation of a running scan.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT
 * - A watcher thread turns the signal flag into a cancellation request
 * - The scan polls isShutdownRequested() before starting each file
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Programmatically request cancellation (any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Called once, on the thread that requests the shutdown
    void onShutdown(std::function<void()> callback);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // "SIGINT", "SIGTERM", "SIGQUIT", or "signal <n>"
    static std::string getSignalName(int signal_number);

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::vector<std::function<void()>> callbacks_;
    mutable std::mutex mutex_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
