#include "core/metadata_probe.hpp"
#include "core/analysis_error.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace
{
    std::string secondsToString(double seconds)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(6) << seconds;
        return ss.str();
    }
}

MediaMetadata MetadataProbe::probe(const std::string &file_path) const
{
    ProbeRecord record = readRecord(file_path);
    MediaMetadata metadata = fromRecord(record, file_path);

    Logger::info("Probed " + file_path + " - duration: " + secondsToString(metadata.duration_seconds) +
                 "s, size: " + std::to_string(metadata.width) + "x" + std::to_string(metadata.height) +
                 ", fps: " + secondsToString(metadata.fps));
    return metadata;
}

MediaMetadata MetadataProbe::fromRecord(const ProbeRecord &record, const std::string &file_path)
{
    const ProbeStream *video_stream = nullptr;
    for (const auto &stream : record.streams)
    {
        if (stream.codec_type == "video")
        {
            video_stream = &stream;
            break;
        }
    }

    if (!video_stream)
    {
        throw AnalysisError(ErrorKind::VALIDATION, ProbeError::NoVideoStream,
                            "No video stream found in " + file_path);
    }

    std::optional<std::string> duration = video_stream->duration;
    if (!duration)
        duration = record.format_duration;

    if (!duration || !video_stream->width || !video_stream->height || !video_stream->r_frame_rate ||
        *video_stream->width <= 0 || *video_stream->height <= 0)
    {
        throw AnalysisError(ErrorKind::VALIDATION, ProbeError::NoVideoStream,
                            "Essential video metadata (duration, width, height, fps) not found in " + file_path);
    }

    MediaMetadata metadata;
    metadata.duration_seconds = parseDuration(*duration);
    metadata.width = *video_stream->width;
    metadata.height = *video_stream->height;
    metadata.fps = parseFrameRate(*video_stream->r_frame_rate);
    return metadata;
}

double MetadataProbe::parseFrameRate(const std::string &rate)
{
    auto slash = rate.find('/');
    if (slash == std::string::npos)
        return kDefaultFps;

    try
    {
        size_t num_end = 0;
        size_t den_end = 0;
        std::string num_str = rate.substr(0, slash);
        std::string den_str = rate.substr(slash + 1);
        double num = std::stod(num_str, &num_end);
        double den = std::stod(den_str, &den_end);
        if (num_end != num_str.size() || den_end != den_str.size())
            return kDefaultFps;
        if (den == 0.0 || num <= 0.0)
            return kDefaultFps;
        double fps = num / den;
        if (!std::isfinite(fps) || fps <= 0.0)
            return kDefaultFps;
        return fps;
    }
    catch (const std::exception &)
    {
        return kDefaultFps;
    }
}

double MetadataProbe::parseDuration(const std::string &duration)
{
    try
    {
        size_t end = 0;
        double value = std::stod(duration, &end);
        if (end == 0 || !std::isfinite(value) || value < 0.0)
            return 0.0;
        return value;
    }
    catch (const std::exception &)
    {
        return 0.0;
    }
}

ProbeRecord FFmpegMetadataProbe::readRecord(const std::string &file_path) const
{
    AVFormatContextRAII format_ctx;

    int open_result = avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr);
    if (open_result < 0)
    {
        throw AnalysisError(ErrorKind::EXTERNAL_TOOL, ProbeError::OpenFailed,
                            "Could not open media file: " + file_path + " - " + avErrorString(open_result));
    }

    int stream_info_result = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (stream_info_result < 0)
    {
        throw AnalysisError(ErrorKind::EXTERNAL_TOOL, ProbeError::OpenFailed,
                            "Could not find stream information: " + file_path + " - " + avErrorString(stream_info_result));
    }

    ProbeRecord record;
    if (format_ctx.get()->duration != AV_NOPTS_VALUE)
    {
        record.format_duration = secondsToString(static_cast<double>(format_ctx.get()->duration) / AV_TIME_BASE);
    }

    for (unsigned int i = 0; i < format_ctx.get()->nb_streams; i++)
    {
        const AVStream *stream = format_ctx.get()->streams[i];
        const AVCodecParameters *codec_params = stream->codecpar;

        ProbeStream entry;
        const char *type_name = av_get_media_type_string(codec_params->codec_type);
        entry.codec_type = type_name ? type_name : "unknown";

        if (stream->duration != AV_NOPTS_VALUE)
        {
            entry.duration = secondsToString(static_cast<double>(stream->duration) * av_q2d(stream->time_base));
        }

        if (codec_params->codec_type == AVMEDIA_TYPE_VIDEO)
        {
            if (codec_params->width > 0)
                entry.width = codec_params->width;
            if (codec_params->height > 0)
                entry.height = codec_params->height;
            entry.r_frame_rate = std::to_string(stream->r_frame_rate.num) + "/" +
                                 std::to_string(stream->r_frame_rate.den);
        }

        record.streams.push_back(entry);
    }

    Logger::debug("Probe record for " + file_path + ": " + std::to_string(record.streams.size()) + " stream(s)");
    return record;
}
