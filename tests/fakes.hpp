#pragma once

#include "core/analysis_error.hpp"
#include "core/extraction_engine.hpp"
#include "core/metadata_probe.hpp"
#include "core/pose_estimator.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief MetadataProbe returning canned metadata per path
 */
class FakeMetadataProbe : public MetadataProbe
{
public:
    MediaMetadata probe(const std::string &file_path) const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        probed_.push_back(file_path);
        if (failing.count(file_path))
        {
            throw AnalysisError(ErrorKind::EXTERNAL_TOOL, ProbeError::OpenFailed, "cannot open " + file_path);
        }
        auto it = metadata.find(file_path);
        if (it == metadata.end())
        {
            MediaMetadata fallback;
            fallback.duration_seconds = 3.0;
            fallback.width = 64;
            fallback.height = 48;
            fallback.fps = 30.0;
            return fallback;
        }
        return it->second;
    }

    ProbeRecord readRecord(const std::string &file_path) const override
    {
        return records.at(file_path);
    }

    std::vector<std::string> probed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return probed_;
    }

    std::map<std::string, MediaMetadata> metadata;
    std::map<std::string, ProbeRecord> records;
    std::set<std::string> failing;

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::string> probed_;
};

/**
 * @brief MetadataProbe exercising the shared probe() path over canned records
 */
class RecordOnlyProbe : public MetadataProbe
{
public:
    ProbeRecord readRecord(const std::string &file_path) const override
    {
        return records.at(file_path);
    }

    std::map<std::string, ProbeRecord> records;
};

/**
 * @brief ExtractionEngine writing small PNG frames instead of running ffmpeg
 */
class FakeExtractionEngine : public ExtractionEngine
{
public:
    void extract(const ExtractionRequest &request, const CancellationToken &cancel) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        if (fail_sources.count(request.source_path))
        {
            throw AnalysisError(ErrorKind::EXTERNAL_TOOL, SampleError::ExtractionFailed,
                                "ffmpeg (multi-frame) error, exit code 1: simulated failure");
        }

        int count = request.mode == ExtractionMode::SINGLE_FRAME ? 1 : request.target_frames;
        auto it = frames_per_source.find(request.source_path);
        if (it != frames_per_source.end())
            count = it->second;

        for (int i = 1; i <= count; ++i)
        {
            char name[256];
            std::snprintf(name, sizeof(name), request.output_pattern.c_str(), i);
            cv::Mat image(8, 8, CV_8UC3, cv::Scalar(i % 256, 64, 128));
            cv::imwrite((std::filesystem::path(request.output_dir) / name).string(), image);
        }

        if (block_sources.count(request.source_path))
        {
            auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!cancel.isCancelled() && std::chrono::steady_clock::now() < give_up)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            cancel.throwIfCancelled("Fake extraction of " + request.source_path);
        }
    }

    std::vector<ExtractionRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::map<std::string, int> frames_per_source; // override produced frame count
    std::set<std::string> fail_sources;
    std::set<std::string> block_sources; // wait for cancellation after writing

private:
    mutable std::mutex mutex_;
    std::vector<ExtractionRequest> requests_;
};

inline std::vector<Landmark> makePose(double offset = 0.0, size_t count = kPoseLandmarkCount)
{
    std::vector<Landmark> pose;
    for (size_t i = 0; i < count; ++i)
    {
        Landmark landmark;
        landmark.x = 0.01 * static_cast<double>(i) + offset;
        landmark.y = 0.5 + offset;
        landmark.z = 0.0;
        landmark.visibility = 0.9;
        pose.push_back(landmark);
    }
    return pose;
}

/**
 * @brief PoseEstimator returning a fixed pose and counting session lifetimes
 */
class FakePoseEstimator : public PoseEstimator
{
public:
    class Session : public PoseSession
    {
    public:
        explicit Session(FakePoseEstimator &owner) : owner_(owner) { owner_.opened++; }
        ~Session() override { owner_.released++; }

        LandmarkSet detect(const FrameImage &image) override
        {
            int call = owner_.detect_calls++;
            if (owner_.engine_broken)
            {
                throw AnalysisError(ErrorKind::EXTERNAL_TOOL, RunError::EstimatorUnavailable,
                                    "Pose model produced no landmark tensor");
            }
            if (owner_.throw_on_call == call)
                throw std::runtime_error("inference failed");
            if (owner_.no_pose_on_call == call)
                return std::nullopt;
            if (image.width <= 0 || image.height <= 0)
                return std::nullopt;
            return owner_.pose;
        }

    private:
        FakePoseEstimator &owner_;
    };

    std::unique_ptr<PoseSession> openSession() override
    {
        if (fail_open)
        {
            throw AnalysisError(ErrorKind::EXTERNAL_TOOL, RunError::EstimatorUnavailable, "model not loaded");
        }
        return std::make_unique<Session>(*this);
    }

    std::vector<Landmark> pose = makePose();
    bool fail_open = false;
    bool engine_broken = false; // every detect() reports an unusable engine
    int throw_on_call = -1;
    int no_pose_on_call = -1;

    std::atomic<int> opened{0};
    std::atomic<int> released{0};
    std::atomic<int> detect_calls{0};
};
