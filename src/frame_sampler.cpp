#include "core/frame_sampler.hpp"
#include "core/analysis_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    void removePartialOutput(const std::string &output_dir, const std::string &cause)
    {
        std::error_code rm_ec;
        fs::remove_all(output_dir, rm_ec);
        if (rm_ec)
        {
            Logger::error("Error cleaning up directory " + output_dir + ": " + rm_ec.message());
        }
        else
        {
            Logger::debug("Removed partial output " + output_dir + " after failure: " + cause);
        }
    }
}

FrameSampler::FrameSampler(ExtractionEngine &engine, const std::string &frame_pattern)
    : engine_(engine), frame_pattern_(frame_pattern)
{
    // "frame_%04d.png" -> prefix "frame_", suffix ".png"
    auto percent = frame_pattern_.find('%');
    if (percent == std::string::npos)
    {
        frame_prefix_ = fs::path(frame_pattern_).stem().string();
        frame_suffix_ = fs::path(frame_pattern_).extension().string();
    }
    else
    {
        frame_prefix_ = frame_pattern_.substr(0, percent);
        auto conversion = frame_pattern_.find('d', percent);
        frame_suffix_ = conversion == std::string::npos ? "" : frame_pattern_.substr(conversion + 1);
    }
}

bool FrameSampler::isDegenerate(const MediaMetadata &metadata)
{
    return metadata.duration_seconds <= 0.0 || metadata.fps <= 0.0;
}

std::vector<std::string> FrameSampler::reconcile(std::vector<std::string> raw, int target_frames)
{
    if (raw.empty())
    {
        throw AnalysisError(ErrorKind::INTEGRITY, SampleError::NoFramesProduced,
                            "No frames were extracted; the source is unusable");
    }

    const size_t target = static_cast<size_t>(target_frames);
    if (raw.size() < target)
    {
        const std::string last = raw.back();
        raw.resize(target, last);
    }
    else if (raw.size() > target)
    {
        raw.erase(raw.begin() + static_cast<std::ptrdiff_t>(target), raw.end());
    }
    return raw;
}

std::vector<std::string> FrameSampler::listFrames(const std::string &output_dir) const
{
    std::vector<std::string> frames;
    for (const auto &entry : fs::directory_iterator(output_dir))
    {
        if (!entry.is_regular_file())
            continue;
        std::string name = entry.path().filename().string();
        if (name.size() < frame_prefix_.size() + frame_suffix_.size())
            continue;
        if (name.compare(0, frame_prefix_.size(), frame_prefix_) != 0)
            continue;
        if (name.compare(name.size() - frame_suffix_.size(), frame_suffix_.size(), frame_suffix_) != 0)
            continue;
        frames.push_back(entry.path().string());
    }
    // Zero padded sequence numbers sort correctly as text
    std::sort(frames.begin(), frames.end());
    return frames;
}

FrameSet FrameSampler::sample(const std::string &video_path,
                              int target_frames,
                              const MediaMetadata &metadata,
                              const std::string &output_dir,
                              const CancellationToken &cancel)
{
    if (target_frames <= 0)
    {
        throw AnalysisError(ErrorKind::VALIDATION, SampleError::InvalidTargetCount,
                            "targetFrames must be a positive number, got " + std::to_string(target_frames));
    }

    std::error_code ec;
    if (!fs::is_regular_file(video_path, ec))
    {
        throw AnalysisError(ErrorKind::VALIDATION, SampleError::SourceNotFound,
                            "Video file not found: " + video_path);
    }

    fs::create_directories(output_dir, ec);
    if (ec)
    {
        throw AnalysisError(ErrorKind::RESOURCE, RunError::WorkspaceUnavailable,
                            "Failed to create output directory " + output_dir + ": " + ec.message());
    }

    ExtractionRequest request;
    request.source_path = video_path;
    request.output_dir = output_dir;
    request.output_pattern = frame_pattern_;
    request.target_frames = target_frames;
    request.duration_seconds = metadata.duration_seconds;

    if (isDegenerate(metadata))
    {
        Logger::warn("Video " + video_path + " has duration " + std::to_string(metadata.duration_seconds) +
                     "s or FPS " + std::to_string(metadata.fps) + ". Extracting first frame only.");
        request.mode = ExtractionMode::SINGLE_FRAME;
    }
    else
    {
        request.mode = ExtractionMode::UNIFORM;
    }

    try
    {
        engine_.extract(request, cancel);
        cancel.throwIfCancelled("Frame sampling of " + video_path);

        std::vector<std::string> raw = listFrames(output_dir);
        if (raw.size() != static_cast<size_t>(target_frames))
        {
            Logger::info("Extraction of " + video_path + " produced " + std::to_string(raw.size()) +
                         " frame(s), reconciling to " + std::to_string(target_frames));
        }

        FrameSet frame_set;
        frame_set.frames = reconcile(std::move(raw), target_frames);
        return frame_set;
    }
    catch (const AnalysisError &e)
    {
        removePartialOutput(output_dir, e.what());
        throw;
    }
    catch (const std::exception &e)
    {
        removePartialOutput(output_dir, e.what());
        throw AnalysisError(ErrorKind::RESOURCE, SampleError::ExtractionFailed,
                            "Failed to collect frames in " + output_dir + ": " + e.what());
    }
}
