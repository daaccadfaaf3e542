#include "core/run_coordinator.hpp"
#include "core/analysis_config.hpp"
#include "core/frame_sampler.hpp"
#include "core/pose_sequence_builder.hpp"
#include "core/run_state_machine.hpp"
#include "core/run_workspace.hpp"
#include "core/similarity_scorer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <utility>

namespace fs = std::filesystem;

namespace
{
    // Run one pipeline stage; a failure cancels the sibling stage
    template <typename Fn>
    auto launchStage(Fn fn, CancellationToken siblings)
    {
        return std::async(std::launch::async, [fn = std::move(fn), siblings]() mutable
                          {
            try
            {
                return fn();
            }
            catch (const std::exception &e)
            {
                CancellationToken token = siblings;
                token.cancel(std::string("sibling pipeline failed: ") + e.what());
                throw;
            } });
    }

    /**
     * @brief Wait for both stages and return their results
     *
     * When both fail, the error that is not a cancellation is rethrown so the
     * root cause wins over the sibling abort it triggered.
     */
    template <typename T>
    std::pair<T, T> joinStages(std::future<T> &first, std::future<T> &second)
    {
        T first_value{};
        T second_value{};
        std::exception_ptr first_error;
        std::exception_ptr second_error;

        try
        {
            first_value = first.get();
        }
        catch (const std::exception &)
        {
            first_error = std::current_exception();
        }
        try
        {
            second_value = second.get();
        }
        catch (const std::exception &)
        {
            second_error = std::current_exception();
        }

        auto isCancellation = [](const std::exception_ptr &error)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const AnalysisError &e)
            {
                return e.kind() == ErrorKind::CANCELLED;
            }
            catch (const std::exception &)
            {
                return false;
            }
        };

        if (first_error && second_error)
        {
            if (isCancellation(first_error) && !isCancellation(second_error))
                std::rethrow_exception(second_error);
            std::rethrow_exception(first_error);
        }
        if (first_error)
            std::rethrow_exception(first_error);
        if (second_error)
            std::rethrow_exception(second_error);

        return {std::move(first_value), std::move(second_value)};
    }

    void requireSource(const std::string &path, const std::string &role)
    {
        std::error_code ec;
        if (path.empty() || !fs::is_regular_file(path, ec))
        {
            throw AnalysisError(ErrorKind::VALIDATION, SampleError::SourceNotFound,
                                role + " video not found: " + path);
        }
    }
}

RunCoordinator::Settings RunCoordinator::Settings::fromConfig(const AnalysisConfig &config)
{
    Settings settings;
    settings.workspace_root = config.getWorkspaceRoot();
    settings.frame_pattern = config.getFramePattern();
    settings.pose_max_concurrency = config.getPoseMaxConcurrency();
    settings.run_timeout = std::chrono::seconds(std::max(0, config.getRunTimeoutSeconds()));
    return settings;
}

RunCoordinator::RunCoordinator(MetadataProbe &probe,
                               ExtractionEngine &engine,
                               PoseEstimator &estimator,
                               const Settings &settings)
    : probe_(probe), engine_(engine), estimator_(estimator), settings_(settings)
{
}

AnalysisResult RunCoordinator::runAnalysis(const AnalysisRequest &request, const CancellationToken &cancel)
{
    AnalysisResult result;
    result.run_id = RunWorkspace::newRunId();
    const std::string prefix = "RunID " + result.run_id + ": ";

    RunStateMachine state_machine(result.run_id);
    std::unique_ptr<RunWorkspace> workspace;

    CancellationToken run_token = CancellationToken::childOf(cancel);
    if (settings_.run_timeout.count() > 0)
    {
        run_token.setTimeout(std::chrono::duration_cast<std::chrono::milliseconds>(settings_.run_timeout));
    }

    Logger::info(prefix + "Starting analysis of " + request.short_video + " against " + request.reference_video +
                 " with " + std::to_string(request.target_frames) + " frame(s)");

    try
    {
        if (request.target_frames <= 0)
        {
            throw AnalysisError(ErrorKind::VALIDATION, SampleError::InvalidTargetCount,
                                "targetFrames must be a positive number, got " + std::to_string(request.target_frames));
        }
        requireSource(request.short_video, "Short");
        requireSource(request.reference_video, "Reference");

        workspace = std::make_unique<RunWorkspace>(settings_.workspace_root, result.run_id);
        run_token.throwIfCancelled("Metadata probe");

        MediaMetadata short_metadata = probe_.probe(request.short_video);
        if (request.max_short_duration_seconds > 0.0 &&
            short_metadata.duration_seconds > request.max_short_duration_seconds)
        {
            throw AnalysisError(ErrorKind::VALIDATION, RunError::DurationLimitExceeded,
                                "Short video is " + std::to_string(short_metadata.duration_seconds) +
                                    " seconds long; the limit is " +
                                    std::to_string(request.max_short_duration_seconds) + " seconds");
        }
        MediaMetadata reference_metadata = probe_.probe(request.reference_video);
        state_machine.transitionTo(RunState::METADATA_VALIDATED);
        Logger::info(prefix + "Metadata validated (short " + std::to_string(short_metadata.duration_seconds) +
                     "s, reference " + std::to_string(reference_metadata.duration_seconds) + "s)");

        // Frame sampling, both videos in parallel
        run_token.throwIfCancelled("Frame sampling");
        CancellationToken sample_token = CancellationToken::childOf(run_token);
        FrameSampler sampler(engine_, settings_.frame_pattern);
        const std::string short_dir = workspace->subdir("short_frames");
        const std::string reference_dir = workspace->subdir("reference_frames");

        auto short_frames_future = launchStage([&]
                                               { return sampler.sample(request.short_video, request.target_frames,
                                                                       short_metadata, short_dir, sample_token); },
                                               sample_token);
        auto reference_frames_future = launchStage([&]
                                                   { return sampler.sample(request.reference_video, request.target_frames,
                                                                           reference_metadata, reference_dir, sample_token); },
                                                   sample_token);
        auto frames = joinStages(short_frames_future, reference_frames_future);
        state_machine.transitionTo(RunState::FRAMES_EXTRACTED);
        Logger::info(prefix + "Frames extracted (" + std::to_string(frames.first.size()) + " per video)");

        // Pose estimation, both videos in parallel
        run_token.throwIfCancelled("Pose estimation");
        CancellationToken pose_token = CancellationToken::childOf(run_token);
        PoseSequenceBuilder builder(settings_.pose_max_concurrency);

        auto short_poses_future = launchStage([&]
                                              { return builder.build(frames.first, estimator_, pose_token); },
                                              pose_token);
        auto reference_poses_future = launchStage([&]
                                                  { return builder.build(frames.second, estimator_, pose_token); },
                                                  pose_token);
        auto poses = joinStages(short_poses_future, reference_poses_future);
        state_machine.transitionTo(RunState::POSES_ESTIMATED);
        Logger::info(prefix + "Poses estimated");

        const size_t expected = static_cast<size_t>(request.target_frames);
        if (poses.first.size() != expected || poses.second.size() != expected)
        {
            throw AnalysisError(ErrorKind::INTEGRITY, RunError::SequenceLengthMismatch,
                                "Landmark sequence length mismatch: expected " + std::to_string(expected) +
                                    ", got " + std::to_string(poses.first.size()) + " and " +
                                    std::to_string(poses.second.size()));
        }

        run_token.throwIfCancelled("Scoring");
        result.similarity = SimilarityScorer::score(poses.first, poses.second, request.target_frames);
        state_machine.transitionTo(RunState::SCORED);
        result.success = true;
        Logger::info(prefix + result.similarity->analysis_text);
    }
    catch (const AnalysisError &e)
    {
        result.error_kind = e.kind();
        result.error_code = e.code();
        result.error_message = e.what();
        // A stage aborted by its failing sibling still reports the expired deadline
        if (e.kind() == ErrorKind::CANCELLED && run_token.isTimedOut())
        {
            result.error_code = RunError::TimedOut;
        }
        state_machine.transitionTo(RunState::FAILED);
        Logger::error(prefix + "Run failed (" + ErrorKinds::getName(e.kind()) + ", " + e.code() + "): " + e.what());
    }
    catch (const std::exception &e)
    {
        result.error_kind = ErrorKind::INTEGRITY;
        result.error_code = RunError::Internal;
        result.error_message = e.what();
        state_machine.transitionTo(RunState::FAILED);
        Logger::error(prefix + "Run failed with unexpected error: " + e.what());
    }

    // Cleanup runs on every path and never overrides the primary outcome
    if (workspace)
    {
        auto error = workspace->release();
        if (error)
        {
            result.cleanup_warnings.push_back(std::string(RunError::CleanupFailed) + ": " + *error);
            Logger::warn(prefix + *error);
        }
    }

    if (request.owns_sources)
    {
        for (const auto &source : {request.short_video, request.reference_video})
        {
            std::error_code ec;
            fs::remove(source, ec);
            if (ec)
            {
                std::string message = "Failed to delete source " + source + ": " + ec.message();
                result.cleanup_warnings.push_back(std::string(RunError::CleanupFailed) + ": " + message);
                Logger::warn(prefix + message);
            }
            else
            {
                Logger::debug(prefix + "Deleted source " + source);
            }
        }
    }

    state_machine.transitionTo(RunState::CLEANED);
    result.final_state = state_machine.state();
    Logger::info(prefix + "Run finished, success=" + std::string(result.success ? "true" : "false"));
    return result;
}
