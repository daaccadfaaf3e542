#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

// Number of body landmarks in a complete pose
constexpr size_t kPoseLandmarkCount = 33;

/**
 * @brief One body landmark in normalized image coordinates
 */
struct Landmark
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    std::optional<double> visibility; // Informational, not used in scoring
};

// std::nullopt means no pose was detected in the frame
using LandmarkSet = std::optional<std::vector<Landmark>>;

// One LandmarkSet per sampled frame, index aligned with the FrameSet
using LandmarkSequence = std::vector<LandmarkSet>;

/**
 * @brief Decoded frame handed to the inference engine (packed RGB24)
 */
struct FrameImage
{
    std::vector<uint8_t> bytes;
    int width = 0;
    int height = 0;
};

/**
 * @brief Acquired inference session; released when destroyed
 */
class PoseSession
{
public:
    virtual ~PoseSession() = default;

    /**
     * @brief Detect the pose in one frame
     * @return Landmarks, or std::nullopt when no pose is detected
     */
    virtual LandmarkSet detect(const FrameImage &image) = 0;
};

/**
 * @brief Factory for inference sessions of one pose model
 */
class PoseEstimator
{
public:
    virtual ~PoseEstimator() = default;

    /**
     * @brief Acquire a session for a batch of frames
     * @throws AnalysisError EXTERNAL_TOOL when the engine cannot be initialized
     */
    virtual std::unique_ptr<PoseSession> openSession() = 0;
};
