#pragma once

#include "core/cancellation_token.hpp"
#include <string>
#include <vector>

enum class ExtractionMode
{
    UNIFORM,     // target_frames spread across duration_seconds
    SINGLE_FRAME // first decodable frame only
};

/**
 * @brief One request to the frame extraction engine
 */
struct ExtractionRequest
{
    std::string source_path;
    std::string output_dir;
    std::string output_pattern = "frame_%04d.png";
    ExtractionMode mode = ExtractionMode::UNIFORM;
    int target_frames = 0;
    double duration_seconds = 0.0;
};

/**
 * @brief Writes sequentially numbered frame images for a source video
 *
 * The number of images produced is not guaranteed to match the request.
 */
class ExtractionEngine
{
public:
    virtual ~ExtractionEngine() = default;

    /**
     * @brief Run one extraction
     * @throws AnalysisError EXTERNAL_TOOL on engine failure, CANCELLED when aborted
     */
    virtual void extract(const ExtractionRequest &request, const CancellationToken &cancel) = 0;
};

/**
 * @brief ExtractionEngine driving the ffmpeg executable
 */
class FFmpegExtractionEngine : public ExtractionEngine
{
public:
    explicit FFmpegExtractionEngine(const std::string &ffmpeg_path = "ffmpeg");

    void extract(const ExtractionRequest &request, const CancellationToken &cancel) override;

    /**
     * @brief Command-line arguments for a request (without the executable)
     */
    static std::vector<std::string> buildArguments(const ExtractionRequest &request);

private:
    std::string ffmpeg_path_;
};
