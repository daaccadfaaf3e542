#pragma once

#include "core/analysis_result.hpp"
#include "core/cancellation_token.hpp"
#include "core/extraction_engine.hpp"
#include "core/metadata_probe.hpp"
#include "core/pose_estimator.hpp"
#include <chrono>
#include <string>

class AnalysisConfig;

/**
 * @brief Runs probe, sampling, pose estimation and scoring for two videos
 *
 * Each run owns a fresh RunWorkspace that is removed on every exit path,
 * together with the source files when the request owns them. Errors never
 * escape runAnalysis; they are reported through AnalysisResult.
 */
class RunCoordinator
{
public:
    struct Settings
    {
        std::string workspace_root;
        std::string frame_pattern = "frame_%04d.png";
        int pose_max_concurrency = 1;
        std::chrono::seconds run_timeout{300}; // zero disables the deadline

        static Settings fromConfig(const AnalysisConfig &config);
    };

    RunCoordinator(MetadataProbe &probe,
                   ExtractionEngine &engine,
                   PoseEstimator &estimator,
                   const Settings &settings);

    /**
     * @brief Compare the short clip against the reference clip
     * @param request Sources and run parameters
     * @param cancel Caller token; cancelling it aborts the run, which still cleans up
     * @return Result with final state CLEANED on every path
     */
    AnalysisResult runAnalysis(const AnalysisRequest &request,
                               const CancellationToken &cancel = CancellationToken());

private:
    MetadataProbe &probe_;
    ExtractionEngine &engine_;
    PoseEstimator &estimator_;
    Settings settings_;
};
