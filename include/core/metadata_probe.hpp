#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Duration, frame rate and raster size of one source video
 *
 * duration_seconds and fps may be zero for malformed containers.
 */
struct MediaMetadata
{
    double duration_seconds = 0.0;
    int width = 0;
    int height = 0;
    double fps = 0.0;
};

/**
 * @brief One stream entry of a probe record
 *
 * Values are kept as the probe reported them; absent fields are empty.
 */
struct ProbeStream
{
    std::string codec_type;                  // "video", "audio", ...
    std::optional<std::string> duration;     // seconds, decimal text
    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> r_frame_rate; // "num/den"
};

/**
 * @brief Structured result of the probe call
 */
struct ProbeRecord
{
    std::vector<ProbeStream> streams;
    std::optional<std::string> format_duration;
};

/**
 * @brief Derives MediaMetadata for a media file
 */
class MetadataProbe
{
public:
    static constexpr double kDefaultFps = 30.0;

    virtual ~MetadataProbe() = default;

    /**
     * @brief Probe a media file
     * @param file_path Path to the media file
     * @return MediaMetadata of the first video stream
     * @throws AnalysisError EXTERNAL_TOOL when the file cannot be probed,
     *         VALIDATION (ProbeError::NoVideoStream) when no usable video stream exists
     */
    virtual MediaMetadata probe(const std::string &file_path) const;

    /**
     * @brief Read the raw probe record for a file
     */
    virtual ProbeRecord readRecord(const std::string &file_path) const = 0;

    /**
     * @brief Turn a probe record into MediaMetadata
     *
     * Requires a video stream with duration (stream or container), width,
     * height and frame rate. Unparseable durations become 0.0 and unusable
     * frame rates become kDefaultFps.
     */
    static MediaMetadata fromRecord(const ProbeRecord &record, const std::string &file_path = "");

    static double parseFrameRate(const std::string &rate);
    static double parseDuration(const std::string &duration);
};

/**
 * @brief MetadataProbe backed by FFmpeg's libavformat
 */
class FFmpegMetadataProbe : public MetadataProbe
{
public:
    ProbeRecord readRecord(const std::string &file_path) const override;
};
