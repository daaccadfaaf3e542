#pragma once

#include "core/pose_estimator.hpp"
#include <string>

/**
 * @brief PoseEstimator running a full-body landmark model through OpenCV DNN
 *
 * Expects a BlazePose style landmark network: one NCHW RGB input of
 * input_size x input_size scaled to [0, 1], a landmark tensor of at least
 * 33 x 5 values (x, y, z in input pixels, visibility and presence logits)
 * and a single pose-presence score.
 */
class DnnPoseEstimator : public PoseEstimator
{
public:
    struct Options
    {
        std::string model_path;
        double min_detection_confidence = 0.5;
        int input_size = 256;
        bool presence_is_logit = true; // false when the model already emits a probability
    };

    explicit DnnPoseEstimator(const Options &options);

    std::unique_ptr<PoseSession> openSession() override;

    const Options &options() const { return options_; }

    /**
     * @brief Convert the raw pose-presence output into a probability
     * @param raw Value read from the presence tensor
     * @param is_logit Whether the model emits a logit rather than a probability
     */
    static double presenceProbability(double raw, bool is_logit);

private:
    Options options_;
};
