#pragma once

#include "core/pose_estimator.hpp"
#include <string>
#include <vector>

/**
 * @brief Score and summary produced by SimilarityScorer
 */
struct SimilarityResult
{
    double score = 0.0; // 0..100, one decimal
    std::string analysis_text;
    double average_dissimilarity = 0.0;
    int mismatched_frames = 0; // exactly one side had a pose
    int malformed_frames = 0;  // a present set without kPoseLandmarkCount points
    std::vector<double> frame_dissimilarities;
};

/**
 * @brief Compares two index aligned landmark sequences
 */
class SimilarityScorer
{
public:
    // Average dissimilarity at which the score reaches zero
    static constexpr double kNormalizationCap = 0.5;
    // Small penalty when neither video shows a pose at a frame
    static constexpr double kBothAbsentDissimilarity = 0.1;
    // Penalty for a missing side or unusable landmark data
    static constexpr double kMaxDissimilarity = 1.0;

    /**
     * @brief Score two sequences of target_frames entries each
     *
     * Never throws; a length mismatch yields score 0 with an explanatory text.
     */
    static SimilarityResult score(const LandmarkSequence &short_sequence,
                                  const LandmarkSequence &reference_sequence,
                                  int target_frames);

    /**
     * @brief Mean Euclidean (x, y, z) distance between two complete landmark sets
     */
    static double frameDissimilarity(const std::vector<Landmark> &a, const std::vector<Landmark> &b);
};
