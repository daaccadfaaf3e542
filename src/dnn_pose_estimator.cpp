#include "core/dnn_pose_estimator.hpp"
#include "core/analysis_error.hpp"
#include "logging/logger.hpp"
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <filesystem>

namespace
{
    constexpr int kValuesPerLandmark = 5;

    double sigmoid(double value)
    {
        return 1.0 / (1.0 + std::exp(-value));
    }

    class DnnPoseSession : public PoseSession
    {
    public:
        DnnPoseSession(cv::dnn::Net net, const DnnPoseEstimator::Options &options)
            : net_(std::move(net)), options_(options)
        {
            output_names_ = net_.getUnconnectedOutLayersNames();
        }

        ~DnnPoseSession() override
        {
            Logger::debug("Pose inference session released");
        }

        LandmarkSet detect(const FrameImage &image) override
        {
            if (image.width <= 0 || image.height <= 0 ||
                image.bytes.size() < static_cast<size_t>(image.width) * image.height * 3)
            {
                Logger::warn("Pose inference skipped: frame buffer does not match its dimensions");
                return std::nullopt;
            }

            cv::Mat rgb(image.height, image.width, CV_8UC3, const_cast<uint8_t *>(image.bytes.data()));
            cv::Mat blob = cv::dnn::blobFromImage(rgb, 1.0 / 255.0,
                                                  cv::Size(options_.input_size, options_.input_size),
                                                  cv::Scalar(), false, false, CV_32F);
            net_.setInput(blob);

            std::vector<cv::Mat> outputs;
            net_.forward(outputs, output_names_);

            const cv::Mat *landmark_tensor = nullptr;
            const cv::Mat *presence_tensor = nullptr;
            for (const auto &output : outputs)
            {
                if (output.total() >= kPoseLandmarkCount * kValuesPerLandmark && !landmark_tensor)
                    landmark_tensor = &output;
                else if (output.total() == 1 && !presence_tensor)
                    presence_tensor = &output;
            }

            if (!landmark_tensor)
            {
                throw AnalysisError(ErrorKind::EXTERNAL_TOOL, RunError::EstimatorUnavailable,
                                    "Pose model produced no landmark tensor");
            }

            if (presence_tensor)
            {
                double score = DnnPoseEstimator::presenceProbability(presence_tensor->ptr<float>()[0],
                                                                     options_.presence_is_logit);
                if (score < options_.min_detection_confidence)
                    return std::nullopt;
            }

            cv::Mat flat = landmark_tensor->reshape(1, 1);
            const float *values = flat.ptr<float>();
            const double scale = static_cast<double>(options_.input_size);

            std::vector<Landmark> landmarks;
            landmarks.reserve(kPoseLandmarkCount);
            for (size_t i = 0; i < kPoseLandmarkCount; ++i)
            {
                const float *v = values + i * kValuesPerLandmark;
                Landmark landmark;
                landmark.x = v[0] / scale;
                landmark.y = v[1] / scale;
                landmark.z = v[2] / scale;
                landmark.visibility = sigmoid(v[3]);
                landmarks.push_back(landmark);
            }
            return landmarks;
        }

    private:
        cv::dnn::Net net_;
        DnnPoseEstimator::Options options_;
        std::vector<std::string> output_names_;
    };
}

DnnPoseEstimator::DnnPoseEstimator(const Options &options)
    : options_(options)
{
}

double DnnPoseEstimator::presenceProbability(double raw, bool is_logit)
{
    return is_logit ? sigmoid(raw) : raw;
}

std::unique_ptr<PoseSession> DnnPoseEstimator::openSession()
{
    if (!std::filesystem::exists(options_.model_path))
    {
        throw AnalysisError(ErrorKind::EXTERNAL_TOOL, RunError::EstimatorUnavailable,
                            "Pose model not found at: " + options_.model_path);
    }

    try
    {
        cv::dnn::Net net = cv::dnn::readNet(options_.model_path);
        if (net.empty())
        {
            throw AnalysisError(ErrorKind::EXTERNAL_TOOL, RunError::EstimatorUnavailable,
                                "Failed to load pose model: " + options_.model_path);
        }
        Logger::debug("Pose inference session opened with " + options_.model_path);
        return std::make_unique<DnnPoseSession>(std::move(net), options_);
    }
    catch (const cv::Exception &e)
    {
        throw AnalysisError(ErrorKind::EXTERNAL_TOOL, RunError::EstimatorUnavailable,
                            "OpenCV error loading pose model " + options_.model_path + ": " + e.what());
    }
}
