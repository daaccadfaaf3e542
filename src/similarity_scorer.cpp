#include "core/similarity_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace
{
    std::string formatFixed(double value, int precision)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(precision) << value;
        return out.str();
    }
}

double SimilarityScorer::frameDissimilarity(const std::vector<Landmark> &a, const std::vector<Landmark> &b)
{
    const size_t count = std::min(a.size(), b.size());
    if (count == 0)
    {
        return kMaxDissimilarity;
    }

    double total = 0.0;
    for (size_t i = 0; i < count; ++i)
    {
        const double dx = a[i].x - b[i].x;
        const double dy = a[i].y - b[i].y;
        const double dz = a[i].z - b[i].z;
        total += std::sqrt(dx * dx + dy * dy + dz * dz);
    }
    return total / static_cast<double>(count);
}

SimilarityResult SimilarityScorer::score(const LandmarkSequence &short_sequence,
                                         const LandmarkSequence &reference_sequence,
                                         int target_frames)
{
    SimilarityResult result;

    if (target_frames < 0 ||
        short_sequence.size() != static_cast<size_t>(target_frames) ||
        reference_sequence.size() != static_cast<size_t>(target_frames))
    {
        result.analysis_text = "Error: Landmark data length mismatch. Input landmark arrays length mismatch. Expected " +
                               std::to_string(target_frames) + ", got " + std::to_string(short_sequence.size()) +
                               " and " + std::to_string(reference_sequence.size()) + ".";
        return result;
    }

    if (target_frames == 0)
    {
        result.analysis_text = "No frames to compare.";
        return result;
    }

    double total = 0.0;
    result.frame_dissimilarities.reserve(static_cast<size_t>(target_frames));
    for (size_t i = 0; i < static_cast<size_t>(target_frames); ++i)
    {
        const LandmarkSet &a = short_sequence[i];
        const LandmarkSet &b = reference_sequence[i];
        double d;

        if (a && b)
        {
            if (a->size() != kPoseLandmarkCount || b->size() != kPoseLandmarkCount)
            {
                d = kMaxDissimilarity;
                ++result.malformed_frames;
            }
            else
            {
                d = frameDissimilarity(*a, *b);
                if (!std::isfinite(d))
                {
                    // NaN or infinite coordinates
                    d = kMaxDissimilarity;
                    ++result.malformed_frames;
                }
            }
        }
        else if (a || b)
        {
            d = kMaxDissimilarity;
            ++result.mismatched_frames;
        }
        else
        {
            d = kBothAbsentDissimilarity;
        }

        result.frame_dissimilarities.push_back(d);
        total += d;
    }

    result.average_dissimilarity = total / static_cast<double>(target_frames);
    const double normalized = std::clamp(1.0 - result.average_dissimilarity / kNormalizationCap, 0.0, 1.0);
    result.score = std::round(normalized * 1000.0) / 10.0;

    result.analysis_text = "Overall similarity: " + formatFixed(result.score, 1) +
                           "%. Average dissimilarity per frame: " + formatFixed(result.average_dissimilarity, 3) +
                           " (lower is better). ";
    if (result.mismatched_frames > 0)
    {
        result.analysis_text += std::to_string(result.mismatched_frames) + " frame(s) had one pose missing. ";
    }
    if (result.malformed_frames > 0)
    {
        result.analysis_text += std::to_string(result.malformed_frames) + " frame(s) had malformed landmark data. ";
    }
    return result;
}
