#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide shutdown coordination for the document server.
 * - SIGINT/SIGTERM only set a flag; a watcher thread turns it into a request
 * - Registered hooks run once, in registration order, on the requesting thread
 * - waitForShutdown() blocks until the hooks have finished
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Hooks registered after shutdown started are never run
    void onShutdown(std::function<void()> hook);

    // Safe from any thread except a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    void waitForShutdown();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Tests only
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_started_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::vector<std::function<void()>> hooks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_num_;
};
