#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Shared cancellation flag with an optional deadline and parent
 *
 * Copies share state. A child token reports cancellation when it, or any
 * of its ancestors, is cancelled or past its deadline.
 */
class CancellationToken
{
public:
    CancellationToken();

    /**
     * @brief Create a token linked to a parent
     * @param parent Token whose cancellation propagates to the new one
     */
    static CancellationToken childOf(const CancellationToken &parent);

    void cancel(const std::string &reason = "cancelled");

    void setDeadline(std::chrono::steady_clock::time_point deadline);
    void setTimeout(std::chrono::milliseconds timeout);

    bool isCancelled() const;
    bool isTimedOut() const;
    std::string reason() const;

    /**
     * @brief Throw AnalysisError(CANCELLED) when the token is cancelled or expired
     * @param where Operation name used in the error message
     */
    void throwIfCancelled(const std::string &where) const;

private:
    struct State
    {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> has_deadline{false};
        std::atomic<std::chrono::steady_clock::rep> deadline_ticks{0};
        mutable std::mutex reason_mutex;
        std::string reason;
        std::shared_ptr<State> parent;
    };

    static bool stateCancelled(const State &state);
    static bool stateTimedOut(const State &state);

    std::shared_ptr<State> state_;
};
