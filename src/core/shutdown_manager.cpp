#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

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
    std::signal(SIGINT, &ShutdownManager::handleSignal);
    std::signal(SIGTERM, &ShutdownManager::handleSignal);
    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
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
            const int sig = signal_num_;
            if (sig != 0)
            {
                signal_num_ = 0;
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

void ShutdownManager::onShutdown(std::function<void()> hook)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (!shutdown_started_.load())
    {
        hooks_.push_back(std::move(hook));
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_started_.exchange(true))
    {
        return;
    }

    std::vector<std::function<void()>> hooks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        hooks.swap(hooks_);
    }
    last_signal_.store(signal_number);

    if (signal_number != 0)
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", shutting down");
    else
        Logger::info("ShutdownManager: shutdown requested - " + reason);

    for (auto &hook : hooks)
    {
        try
        {
            hook();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: shutdown hook failed: " + std::string(e.what()));
        }
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
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

    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_started_.store(false);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_num_ = 0;
    reason_.clear();
    hooks_.clear();
}
