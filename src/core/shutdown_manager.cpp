#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t ShutdownManager::pending_signal_ = 0;

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
    Logger::debug("ShutdownManager: SIGINT/SIGTERM cancel the current run");
}

void ShutdownManager::restoreSignalHandlers()
{
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    stopWatcher();
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    pending_signal_ = sig;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        std::unique_lock<std::mutex> lk(watcher_mutex_);
        while (watcher_running_.load())
        {
            int sig = pending_signal_;
            if (sig != 0)
            {
                pending_signal_ = 0;
                lk.unlock();
                requestShutdown("Received signal " + std::to_string(sig), sig);
                lk.lock();
            }
            watcher_cv_.wait_for(lk, std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    if (!watcher_running_.exchange(false))
    {
        return;
    }
    watcher_cv_.notify_all();
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::setShutdownCallback(Callback callback)
{
    std::lock_guard<std::mutex> lk(mutex_);
    callback_ = std::move(callback);
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    Callback callback;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
        callback = callback_;
    }

    Logger::warn("ShutdownManager: " + reason + ", cancelling the current run");

    if (callback)
    {
        try
        {
            callback(reason);
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("ShutdownManager: shutdown callback failed - ") + e.what());
        }
    }
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();
    pending_signal_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    reason_.clear();
    callback_ = nullptr;
}
