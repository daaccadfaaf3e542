#include <gtest/gtest.h>
#include "core/similarity_scorer.hpp"
#include "fakes.hpp"
#include <cmath>
#include <limits>

class SimilarityScorerTest : public ::testing::Test
{
protected:
    LandmarkSequence repeat(const LandmarkSet &set, size_t count)
    {
        return LandmarkSequence(count, set);
    }
};

TEST_F(SimilarityScorerTest, IdenticalSequencesScoreFullMarks)
{
    auto sequence = repeat(makePose(), 3);
    auto result = SimilarityScorer::score(sequence, sequence, 3);

    EXPECT_DOUBLE_EQ(result.score, 100.0);
    EXPECT_EQ(result.mismatched_frames, 0);
    EXPECT_EQ(result.analysis_text,
              "Overall similarity: 100.0%. Average dissimilarity per frame: 0.000 (lower is better). ");
    ASSERT_EQ(result.frame_dissimilarities.size(), 3u);
}

TEST_F(SimilarityScorerTest, OneSidedMissingPoseCountsAsMismatch)
{
    auto a = repeat(makePose(), 3);
    auto b = repeat(makePose(0.001), 3);
    a[1] = std::nullopt;

    auto result = SimilarityScorer::score(a, b, 3);

    EXPECT_EQ(result.mismatched_frames, 1);
    EXPECT_GT(result.score, 10.0);
    EXPECT_LT(result.score, 70.0);
    EXPECT_DOUBLE_EQ(result.frame_dissimilarities[1], SimilarityScorer::kMaxDissimilarity);
    EXPECT_NE(result.analysis_text.find("1 frame(s) had one pose missing. "), std::string::npos);
}

TEST_F(SimilarityScorerTest, BothAbsentFrameAddsSmallPenalty)
{
    auto a = repeat(makePose(), 3);
    auto b = repeat(makePose(), 3);
    a[1] = std::nullopt;
    b[1] = std::nullopt;

    auto result = SimilarityScorer::score(a, b, 3);

    EXPECT_DOUBLE_EQ(result.frame_dissimilarities[1], SimilarityScorer::kBothAbsentDissimilarity);
    EXPECT_EQ(result.mismatched_frames, 0);
    EXPECT_GT(result.score, 90.0);
    EXPECT_DOUBLE_EQ(result.score, 93.3);
}

TEST_F(SimilarityScorerTest, LengthMismatchReturnsZeroWithoutThrowing)
{
    auto a = repeat(makePose(), 3);
    auto b = repeat(makePose(), 2);

    SimilarityResult result;
    EXPECT_NO_THROW(result = SimilarityScorer::score(a, b, 3));
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_EQ(result.analysis_text,
              "Error: Landmark data length mismatch. Input landmark arrays length mismatch. Expected 3, got 3 and 2.");
}

TEST_F(SimilarityScorerTest, ZeroFramesHasNothingToCompare)
{
    auto result = SimilarityScorer::score({}, {}, 0);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_EQ(result.analysis_text, "No frames to compare.");
}

TEST_F(SimilarityScorerTest, MalformedLandmarkSetsAreCountedSeparately)
{
    auto a = repeat(makePose(), 2);
    auto b = repeat(makePose(), 2);
    a[0] = makePose(0.0, 17);

    auto result = SimilarityScorer::score(a, b, 2);

    EXPECT_EQ(result.malformed_frames, 1);
    EXPECT_EQ(result.mismatched_frames, 0);
    EXPECT_DOUBLE_EQ(result.frame_dissimilarities[0], 1.0);
    EXPECT_NE(result.analysis_text.find("1 frame(s) had malformed landmark data. "), std::string::npos);
}

TEST_F(SimilarityScorerTest, NonFiniteCoordinatesKeepScoreInRange)
{
    auto a = repeat(makePose(), 2);
    auto b = repeat(makePose(), 2);
    (*a[0])[0].x = std::numeric_limits<double>::quiet_NaN();
    (*b[1])[3].y = std::numeric_limits<double>::infinity();

    auto result = SimilarityScorer::score(a, b, 2);

    EXPECT_FALSE(std::isnan(result.score));
    EXPECT_GE(result.score, 0.0);
    EXPECT_LE(result.score, 100.0);
    EXPECT_EQ(result.malformed_frames, 2);
    EXPECT_DOUBLE_EQ(result.frame_dissimilarities[0], SimilarityScorer::kMaxDissimilarity);
    EXPECT_DOUBLE_EQ(result.frame_dissimilarities[1], SimilarityScorer::kMaxDissimilarity);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
}

TEST_F(SimilarityScorerTest, LargeDistancesClampToZero)
{
    auto a = repeat(makePose(0.0), 4);
    auto b = repeat(makePose(0.9), 4);

    auto result = SimilarityScorer::score(a, b, 4);

    EXPECT_GE(result.average_dissimilarity, SimilarityScorer::kNormalizationCap);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
}

TEST_F(SimilarityScorerTest, VisibilityDoesNotAffectDistance)
{
    auto pose = makePose();
    auto hidden = pose;
    for (auto &landmark : hidden)
        landmark.visibility = 0.0;

    EXPECT_DOUBLE_EQ(SimilarityScorer::frameDissimilarity(pose, hidden), 0.0);
}

TEST_F(SimilarityScorerTest, ScoreIsRoundedToOneDecimal)
{
    auto a = repeat(makePose(0.0), 1);
    auto b = repeat(makePose(0.0), 1);
    // Shift every point by 0.0123 along z: d = 0.0123, score = 97.54 -> 97.5
    for (auto &landmark : *b[0])
        landmark.z += 0.0123;

    auto result = SimilarityScorer::score(a, b, 1);
    EXPECT_NEAR(result.average_dissimilarity, 0.0123, 1e-12);
    EXPECT_DOUBLE_EQ(result.score, 97.5);
}
