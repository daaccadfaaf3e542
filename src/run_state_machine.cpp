#include "core/run_state_machine.hpp"
#include "logging/logger.hpp"

RunStateMachine::RunStateMachine(const std::string &run_id)
    : run_id_(run_id)
{
}

RunState RunStateMachine::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool RunStateMachine::isLegal(RunState from, RunState to)
{
    switch (to)
    {
    case RunState::METADATA_VALIDATED:
        return from == RunState::CREATED;
    case RunState::FRAMES_EXTRACTED:
        return from == RunState::METADATA_VALIDATED;
    case RunState::POSES_ESTIMATED:
        return from == RunState::FRAMES_EXTRACTED;
    case RunState::SCORED:
        return from == RunState::POSES_ESTIMATED;
    case RunState::FAILED:
        return from != RunState::SCORED && from != RunState::FAILED && from != RunState::CLEANED;
    case RunState::CLEANED:
        return from == RunState::SCORED || from == RunState::FAILED;
    case RunState::CREATED:
    default:
        return false;
    }
}

bool RunStateMachine::transitionTo(RunState next)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isLegal(state_, next))
    {
        illegal_transitions_.emplace_back(state_, next);
        Logger::error("RunID " + run_id_ + ": illegal state transition " + getStateName(state_) +
                      " -> " + getStateName(next));
        return false;
    }

    Logger::debug("RunID " + run_id_ + ": " + getStateName(state_) + " -> " + getStateName(next));
    state_ = next;
    return true;
}

size_t RunStateMachine::illegalTransitionCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return illegal_transitions_.size();
}

std::vector<std::pair<RunState, RunState>> RunStateMachine::illegalTransitions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return illegal_transitions_;
}

std::string RunStateMachine::getStateName(RunState state)
{
    switch (state)
    {
    case RunState::CREATED:
        return "CREATED";
    case RunState::METADATA_VALIDATED:
        return "METADATA_VALIDATED";
    case RunState::FRAMES_EXTRACTED:
        return "FRAMES_EXTRACTED";
    case RunState::POSES_ESTIMATED:
        return "POSES_ESTIMATED";
    case RunState::SCORED:
        return "SCORED";
    case RunState::FAILED:
        return "FAILED";
    case RunState::CLEANED:
        return "CLEANED";
    default:
        return "UNKNOWN";
    }
}
