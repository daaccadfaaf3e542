#include "core/cancellation_token.hpp"
#include "core/analysis_error.hpp"

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>())
{
}

CancellationToken CancellationToken::childOf(const CancellationToken &parent)
{
    CancellationToken child;
    child.state_->parent = parent.state_;
    return child;
}

void CancellationToken::cancel(const std::string &reason)
{
    {
        std::lock_guard<std::mutex> lock(state_->reason_mutex);
        if (state_->reason.empty())
            state_->reason = reason;
    }
    state_->cancelled.store(true);
}

void CancellationToken::setDeadline(std::chrono::steady_clock::time_point deadline)
{
    state_->deadline_ticks.store(deadline.time_since_epoch().count());
    state_->has_deadline.store(true);
}

void CancellationToken::setTimeout(std::chrono::milliseconds timeout)
{
    setDeadline(std::chrono::steady_clock::now() + timeout);
}

bool CancellationToken::stateTimedOut(const State &state)
{
    for (const State *s = &state; s != nullptr; s = s->parent.get())
    {
        if (s->has_deadline.load() &&
            std::chrono::steady_clock::now().time_since_epoch().count() >= s->deadline_ticks.load())
        {
            return true;
        }
    }
    return false;
}

bool CancellationToken::stateCancelled(const State &state)
{
    for (const State *s = &state; s != nullptr; s = s->parent.get())
    {
        if (s->cancelled.load())
            return true;
    }
    return stateTimedOut(state);
}

bool CancellationToken::isCancelled() const
{
    return stateCancelled(*state_);
}

bool CancellationToken::isTimedOut() const
{
    return stateTimedOut(*state_);
}

std::string CancellationToken::reason() const
{
    for (const State *s = state_.get(); s != nullptr; s = s->parent.get())
    {
        if (s->cancelled.load())
        {
            std::lock_guard<std::mutex> lock(s->reason_mutex);
            return s->reason;
        }
    }
    if (stateTimedOut(*state_))
        return "deadline exceeded";
    return "";
}

void CancellationToken::throwIfCancelled(const std::string &where) const
{
    if (!isCancelled())
        return;

    // An explicit cancel wins over an expired deadline
    bool explicit_cancel = false;
    for (const State *s = state_.get(); s != nullptr; s = s->parent.get())
    {
        if (s->cancelled.load())
        {
            explicit_cancel = true;
            break;
        }
    }

    if (!explicit_cancel)
    {
        throw AnalysisError(ErrorKind::CANCELLED, RunError::TimedOut,
                            where + " aborted: run deadline exceeded");
    }
    throw AnalysisError(ErrorKind::CANCELLED, RunError::Cancelled,
                        where + " aborted: " + reason());
}
