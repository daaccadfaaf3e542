#pragma once

#include "core/cancellation_token.hpp"
#include "core/extraction_engine.hpp"
#include "core/metadata_probe.hpp"
#include <string>
#include <vector>

/**
 * @brief Ordered frame images of one video, one per sample index
 *
 * Padding entries repeat the path of the last extracted frame.
 */
struct FrameSet
{
    std::vector<std::string> frames;

    size_t size() const { return frames.size(); }
    bool empty() const { return frames.empty(); }
    const std::string &operator[](size_t index) const { return frames[index]; }
};

/**
 * @brief Produces exactly target_frames uniformly spaced frames of a video
 */
class FrameSampler
{
public:
    explicit FrameSampler(ExtractionEngine &engine, const std::string &frame_pattern = "frame_%04d.png");

    /**
     * @brief Sample a video into output_dir
     * @param video_path Source video
     * @param target_frames Number of frames wanted, must be positive
     * @param metadata Probed metadata of the source
     * @param output_dir Directory created for the frames; removed again on failure
     * @param cancel Token observed during extraction
     * @return FrameSet with exactly target_frames entries
     * @throws AnalysisError with a SampleError code, or CANCELLED
     */
    FrameSet sample(const std::string &video_path,
                    int target_frames,
                    const MediaMetadata &metadata,
                    const std::string &output_dir,
                    const CancellationToken &cancel);

    /**
     * @brief Force a raw frame list to target_frames entries
     *
     * Pads by repeating the last frame or truncates the tail. Throws
     * SampleError::NoFramesProduced when raw is empty.
     */
    static std::vector<std::string> reconcile(std::vector<std::string> raw, int target_frames);

    /**
     * @brief Frame files in a directory that match the output pattern, sorted by name
     */
    std::vector<std::string> listFrames(const std::string &output_dir) const;

    static bool isDegenerate(const MediaMetadata &metadata);

private:
    ExtractionEngine &engine_;
    std::string frame_pattern_;
    std::string frame_prefix_;
    std::string frame_suffix_;
};
