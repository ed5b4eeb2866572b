#pragma once

#include "core/errors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Cooperative cancellation signal with an optional deadline
 *
 * Workers poll shouldStop() at safe checkpoints. Sleeps through sleepFor()
 * wake up as soon as cancel() is called.
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    explicit CancellationToken(std::chrono::milliseconds timeout)
        : deadline_(std::chrono::steady_clock::now() + timeout) {}

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    // Start (or restart) the deadline from now
    void armTimeout(std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = std::chrono::steady_clock::now() + timeout;
    }

    bool isCancelled() const { return cancelled_.load(); }

    bool isExpired() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
    }

    bool shouldStop() const { return isCancelled() || isExpired(); }

    /**
     * @brief Sleep up to the given duration
     * @return false if cancelled or expired before the sleep finished
     */
    bool sleepFor(std::chrono::milliseconds duration)
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto until = std::chrono::steady_clock::now() + duration;
            if (deadline_ && *deadline_ < until)
                until = *deadline_;
            cv_.wait_until(lock, until, [this]
                           { return cancelled_.load(); });
        }
        return !shouldStop();
    }

    /**
     * @brief Throw CANCELLED, or timeout_code once the deadline passed
     */
    void throwIfStopped(const std::string &where, ErrorCode timeout_code = ErrorCode::STAGE_FAILED) const
    {
        if (isCancelled())
            throw DeepLinkError(ErrorCode::CANCELLED, where + " cancelled");
        if (isExpired())
            throw DeepLinkError(timeout_code, where + " timed out");
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};
