#include "core/pose_sequence_builder.hpp"
#include "core/analysis_error.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <unordered_map>

PoseSequenceBuilder::PoseSequenceBuilder(int max_concurrency)
    : max_concurrency_(std::max(1, max_concurrency))
{
}

std::optional<FrameImage> PoseSequenceBuilder::loadFrame(const std::string &path)
{
    cv::Mat bgr;
    try
    {
        bgr = cv::imread(path, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV failed to read frame " + path + ": " + e.what());
        return std::nullopt;
    }
    if (bgr.empty())
    {
        return std::nullopt;
    }

    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    if (!rgb.isContinuous())
    {
        rgb = rgb.clone();
    }

    FrameImage image;
    image.width = rgb.cols;
    image.height = rgb.rows;
    image.bytes.assign(rgb.data, rgb.data + rgb.total() * rgb.elemSize());
    return image;
}

LandmarkSet PoseSequenceBuilder::detectFrame(PoseSession &session, const std::string &path) const
{
    auto image = loadFrame(path);
    if (!image)
    {
        Logger::warn("Could not decode frame " + path + ", treating it as no pose");
        return std::nullopt;
    }

    try
    {
        return session.detect(*image);
    }
    catch (const AnalysisError &)
    {
        // Engine-level failures (unusable model, cancellation) fail the whole video
        throw;
    }
    catch (const std::exception &e)
    {
        Logger::warn("Pose detection failed for " + path + ": " + e.what());
        return std::nullopt;
    }
}

LandmarkSequence PoseSequenceBuilder::build(const FrameSet &frames,
                                            PoseEstimator &estimator,
                                            const CancellationToken &cancel) const
{
    LandmarkSequence sequence(frames.size());
    if (frames.empty())
    {
        return sequence;
    }

    // Padding repeats the last frame path; infer each distinct path once
    std::vector<size_t> unique_indices;
    std::vector<size_t> source_index(frames.size());
    std::unordered_map<std::string, size_t> first_seen;
    for (size_t i = 0; i < frames.size(); ++i)
    {
        auto it = first_seen.find(frames[i]);
        if (it == first_seen.end())
        {
            first_seen.emplace(frames[i], i);
            unique_indices.push_back(i);
            source_index[i] = i;
        }
        else
        {
            source_index[i] = it->second;
        }
    }

    Logger::debug("Estimating poses for " + std::to_string(frames.size()) + " frame(s), " +
                  std::to_string(unique_indices.size()) + " distinct, concurrency " +
                  std::to_string(max_concurrency_));

    if (max_concurrency_ == 1 || unique_indices.size() == 1)
    {
        auto session = estimator.openSession();
        for (size_t index : unique_indices)
        {
            cancel.throwIfCancelled("Pose estimation");
            sequence[index] = detectFrame(*session, frames[index]);
        }
    }
    else
    {
        tbb::task_arena arena(max_concurrency_);
        arena.execute([&]
                      { tbb::parallel_for(tbb::blocked_range<size_t>(0, unique_indices.size()),
                                          [&](const tbb::blocked_range<size_t> &range)
                                          {
                                              // One session per chunk, released when the chunk ends
                                              auto session = estimator.openSession();
                                              for (size_t k = range.begin(); k != range.end(); ++k)
                                              {
                                                  cancel.throwIfCancelled("Pose estimation");
                                                  size_t index = unique_indices[k];
                                                  sequence[index] = detectFrame(*session, frames[index]);
                                              }
                                          }); });
    }
    cancel.throwIfCancelled("Pose estimation");

    for (size_t i = 0; i < frames.size(); ++i)
    {
        if (source_index[i] != i)
        {
            sequence[i] = sequence[source_index[i]];
        }
    }
    return sequence;
}
