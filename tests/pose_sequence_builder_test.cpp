#include <gtest/gtest.h>
#include "core/pose_sequence_builder.hpp"
#include "core/analysis_error.hpp"
#include "fakes.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class PoseSequenceBuilderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        dir_ = fs::temp_directory_path() / ("pose_builder_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string writeFrame(const std::string &name)
    {
        std::string path = (dir_ / name).string();
        cv::imwrite(path, cv::Mat(8, 8, CV_8UC3, cv::Scalar(10, 20, 30)));
        return path;
    }

    FrameSet makeFrames(size_t count)
    {
        FrameSet frames;
        for (size_t i = 0; i < count; ++i)
        {
            frames.frames.push_back(writeFrame("frame_000" + std::to_string(i + 1) + ".png"));
        }
        return frames;
    }

    fs::path dir_;
    FakePoseEstimator estimator_;
    CancellationToken cancel_;
};

TEST_F(PoseSequenceBuilderTest, ProducesOneEntryPerFrame)
{
    FrameSet frames = makeFrames(4);
    PoseSequenceBuilder builder;

    auto sequence = builder.build(frames, estimator_, cancel_);

    ASSERT_EQ(sequence.size(), 4u);
    for (const auto &set : sequence)
    {
        ASSERT_TRUE(set.has_value());
        EXPECT_EQ(set->size(), kPoseLandmarkCount);
    }
    EXPECT_EQ(estimator_.opened.load(), 1);
    EXPECT_EQ(estimator_.released.load(), 1);
}

TEST_F(PoseSequenceBuilderTest, UndetectedPoseKeepsItsIndex)
{
    FrameSet frames = makeFrames(3);
    estimator_.no_pose_on_call = 1;
    PoseSequenceBuilder builder;

    auto sequence = builder.build(frames, estimator_, cancel_);

    ASSERT_EQ(sequence.size(), 3u);
    EXPECT_TRUE(sequence[0].has_value());
    EXPECT_FALSE(sequence[1].has_value());
    EXPECT_TRUE(sequence[2].has_value());
}

TEST_F(PoseSequenceBuilderTest, UndecodableFrameBecomesAbsent)
{
    FrameSet frames = makeFrames(2);
    std::string broken = (dir_ / "frame_0009.png").string();
    std::ofstream(broken) << "not an image";
    frames.frames.insert(frames.frames.begin() + 1, broken);
    PoseSequenceBuilder builder;

    auto sequence = builder.build(frames, estimator_, cancel_);

    ASSERT_EQ(sequence.size(), 3u);
    EXPECT_FALSE(sequence[1].has_value());
    EXPECT_EQ(estimator_.detect_calls.load(), 2);
}

TEST_F(PoseSequenceBuilderTest, DetectionFailureBecomesAbsent)
{
    FrameSet frames = makeFrames(3);
    estimator_.throw_on_call = 0;
    PoseSequenceBuilder builder;

    auto sequence = builder.build(frames, estimator_, cancel_);

    EXPECT_FALSE(sequence[0].has_value());
    EXPECT_TRUE(sequence[1].has_value());
    EXPECT_EQ(estimator_.released.load(), estimator_.opened.load());
}

TEST_F(PoseSequenceBuilderTest, EngineFailureDuringDetectionFailsTheVideo)
{
    FrameSet frames = makeFrames(3);
    estimator_.engine_broken = true;
    PoseSequenceBuilder builder;

    try
    {
        builder.build(frames, estimator_, cancel_);
        FAIL() << "expected AnalysisError";
    }
    catch (const AnalysisError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::EXTERNAL_TOOL);
        EXPECT_EQ(e.code(), RunError::EstimatorUnavailable);
    }
    EXPECT_EQ(estimator_.detect_calls.load(), 1);
    EXPECT_EQ(estimator_.opened.load(), estimator_.released.load());
}

TEST_F(PoseSequenceBuilderTest, ParallelEngineFailurePropagates)
{
    FrameSet frames = makeFrames(6);
    estimator_.engine_broken = true;
    PoseSequenceBuilder builder(3);

    EXPECT_THROW(builder.build(frames, estimator_, cancel_), AnalysisError);
    EXPECT_EQ(estimator_.opened.load(), estimator_.released.load());
}

TEST_F(PoseSequenceBuilderTest, PaddedFramesReuseTheirSourceResult)
{
    FrameSet frames = makeFrames(2);
    frames.frames.push_back(frames.frames.back());
    frames.frames.push_back(frames.frames.back());
    PoseSequenceBuilder builder;

    auto sequence = builder.build(frames, estimator_, cancel_);

    ASSERT_EQ(sequence.size(), 4u);
    EXPECT_EQ(estimator_.detect_calls.load(), 2);
    EXPECT_TRUE(sequence[3].has_value());
}

TEST_F(PoseSequenceBuilderTest, SessionOpenFailurePropagates)
{
    FrameSet frames = makeFrames(2);
    estimator_.fail_open = true;
    PoseSequenceBuilder builder;

    try
    {
        builder.build(frames, estimator_, cancel_);
        FAIL() << "expected AnalysisError";
    }
    catch (const AnalysisError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::EXTERNAL_TOOL);
    }
}

TEST_F(PoseSequenceBuilderTest, CancellationReleasesSession)
{
    FrameSet frames = makeFrames(3);
    cancel_.cancel("abort");
    PoseSequenceBuilder builder;

    EXPECT_THROW(builder.build(frames, estimator_, cancel_), AnalysisError);
    EXPECT_EQ(estimator_.opened.load(), estimator_.released.load());
}

TEST_F(PoseSequenceBuilderTest, ParallelBuildPreservesOrderAndReleasesSessions)
{
    FrameSet frames = makeFrames(8);
    PoseSequenceBuilder builder(4);

    auto sequence = builder.build(frames, estimator_, cancel_);

    ASSERT_EQ(sequence.size(), 8u);
    for (const auto &set : sequence)
    {
        EXPECT_TRUE(set.has_value());
    }
    EXPECT_GE(estimator_.opened.load(), 1);
    EXPECT_EQ(estimator_.opened.load(), estimator_.released.load());
}

TEST_F(PoseSequenceBuilderTest, EmptyFrameSetGivesEmptySequence)
{
    PoseSequenceBuilder builder;
    auto sequence = builder.build(FrameSet(), estimator_, cancel_);
    EXPECT_TRUE(sequence.empty());
    EXPECT_EQ(estimator_.opened.load(), 0);
}
