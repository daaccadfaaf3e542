#pragma once

#include "core/cancellation_token.hpp"
#include "core/frame_sampler.hpp"
#include "core/pose_estimator.hpp"
#include <optional>
#include <string>

/**
 * @brief Turns a FrameSet into an index aligned LandmarkSequence
 *
 * Every frame is decoded and passed to a PoseSession. A frame that cannot
 * be decoded, or for which detection throws, becomes an absent entry at
 * its own index; the sequence is never shortened. An AnalysisError from the
 * session means the engine itself failed and is rethrown.
 */
class PoseSequenceBuilder
{
public:
    /**
     * @param max_concurrency Frames inferred in parallel; values below 1 are treated as 1
     */
    explicit PoseSequenceBuilder(int max_concurrency = 1);

    /**
     * @brief Estimate poses for every frame
     * @param frames Frames to process
     * @param estimator Source of inference sessions
     * @param cancel Checked between frames
     * @return One LandmarkSet per frame, same order and length as frames
     * @throws AnalysisError EXTERNAL_TOOL when no session can be opened,
     *         CANCELLED when the token fires mid-batch
     */
    LandmarkSequence build(const FrameSet &frames,
                           PoseEstimator &estimator,
                           const CancellationToken &cancel) const;

    /**
     * @brief Read an image file into packed RGB24
     * @return std::nullopt when the file cannot be decoded
     */
    static std::optional<FrameImage> loadFrame(const std::string &path);

    int maxConcurrency() const { return max_concurrency_; }

private:
    LandmarkSet detectFrame(PoseSession &session, const std::string &path) const;

    int max_concurrency_;
};
