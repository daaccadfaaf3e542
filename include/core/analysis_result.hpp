#pragma once

#include "core/analysis_error.hpp"
#include "core/run_state_machine.hpp"
#include "core/similarity_scorer.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Caller input for one comparison run
 */
struct AnalysisRequest
{
    std::string short_video;
    std::string reference_video;
    int target_frames = 30;
    double max_short_duration_seconds = 5.0;
    bool owns_sources = false; // delete both sources when the run ends

    /**
     * @brief Upload-layer rule for the requested frame count
     * @return requested when inside [min_frames, max_frames], fallback otherwise
     */
    static int normalizeTargetFrames(int requested, int min_frames = 10, int max_frames = 60, int fallback = 30);
};

/**
 * @brief Outcome of one run; similarity is set only when the run reached SCORED
 */
struct AnalysisResult
{
    bool success;
    ErrorKind error_kind;
    std::string error_code;
    std::string error_message;
    std::optional<SimilarityResult> similarity;
    RunState final_state;
    std::string run_id;
    std::vector<std::string> cleanup_warnings;

    AnalysisResult() : success(false), error_kind(ErrorKind::NONE), final_state(RunState::CREATED) {}

    nlohmann::json toJson() const;
};
