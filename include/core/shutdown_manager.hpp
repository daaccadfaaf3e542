#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/**
 * Turns SIGINT/SIGTERM into a cancellation request for the in-flight run.
 * - The signal handler only sets sig_atomic_t flags
 * - A watcher thread picks the flags up and runs the registered callback
 * - The first request wins; later ones are ignored
 */
class ShutdownManager
{
public:
    using Callback = std::function<void(const std::string &)>;

    static ShutdownManager &getInstance();

    // Install handlers for SIGINT and SIGTERM and start the watcher
    void installSignalHandlers();

    // Put the default handlers back and stop the watcher
    void restoreSignalHandlers();

    // Register the action run once when shutdown is requested
    void setShutdownCallback(Callback callback);

    // Request shutdown from regular code (not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
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
    Callback callback_;
    mutable std::mutex mutex_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};
    std::mutex watcher_mutex_;
    std::condition_variable watcher_cv_;

    static volatile sig_atomic_t pending_signal_;
};
