#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

enum class RunState
{
    CREATED,
    METADATA_VALIDATED,
    FRAMES_EXTRACTED,
    POSES_ESTIMATED,
    SCORED,
    FAILED,
    CLEANED
};

/**
 * @brief Tracks the lifecycle of one analysis run
 *
 * Forward steps follow the pipeline order. FAILED is reachable from every
 * non-terminal state and CLEANED only from SCORED or FAILED. Illegal
 * requests leave the state unchanged and are recorded.
 */
class RunStateMachine
{
public:
    explicit RunStateMachine(const std::string &run_id = "");

    RunState state() const;

    /**
     * @brief Move to the next state
     * @return true if the transition is legal and was applied
     */
    bool transitionTo(RunState next);

    static bool isLegal(RunState from, RunState to);
    static bool isTerminal(RunState state) { return state == RunState::CLEANED; }
    static std::string getStateName(RunState state);

    size_t illegalTransitionCount() const;
    std::vector<std::pair<RunState, RunState>> illegalTransitions() const;

private:
    std::string run_id_;
    mutable std::mutex mutex_;
    RunState state_ = RunState::CREATED;
    std::vector<std::pair<RunState, RunState>> illegal_transitions_;
};
