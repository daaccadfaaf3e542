#include "core/analysis_result.hpp"

int AnalysisRequest::normalizeTargetFrames(int requested, int min_frames, int max_frames, int fallback)
{
    if (requested < min_frames || requested > max_frames)
        return fallback;
    return requested;
}

nlohmann::json AnalysisResult::toJson() const
{
    nlohmann::json out;
    out["success"] = success;
    out["run_id"] = run_id;
    out["final_state"] = RunStateMachine::getStateName(final_state);

    if (success && similarity)
    {
        out["similarity_score"] = similarity->score;
        out["analysis_text"] = similarity->analysis_text;
        out["average_dissimilarity"] = similarity->average_dissimilarity;
        out["mismatched_frames"] = similarity->mismatched_frames;
        out["malformed_frames"] = similarity->malformed_frames;
        out["frame_dissimilarities"] = similarity->frame_dissimilarities;
    }
    else
    {
        out["error_kind"] = ErrorKinds::getName(error_kind);
        out["error_code"] = error_code;
        out["error"] = error_message;
    }

    if (!cleanup_warnings.empty())
    {
        out["cleanup_warnings"] = cleanup_warnings;
    }
    return out;
}
