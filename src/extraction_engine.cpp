#include "core/extraction_engine.hpp"
#include "core/analysis_error.hpp"
#include "core/external_process.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>

FFmpegExtractionEngine::FFmpegExtractionEngine(const std::string &ffmpeg_path)
    : ffmpeg_path_(ffmpeg_path)
{
}

std::vector<std::string> FFmpegExtractionEngine::buildArguments(const ExtractionRequest &request)
{
    std::string output = (std::filesystem::path(request.output_dir) / request.output_pattern).string();

    std::vector<std::string> args = {"-hide_banner", "-nostdin", "-loglevel", "error", "-y",
                                     "-i", request.source_path};

    if (request.mode == ExtractionMode::SINGLE_FRAME)
    {
        args.push_back("-frames:v");
        args.push_back("1");
    }
    else
    {
        // Time based selection; vfr keeps ffmpeg from duplicating frames to fill a constant cadence
        std::ostringstream filter;
        filter << "fps=" << request.target_frames << "/" << std::setprecision(9) << request.duration_seconds;
        args.push_back("-vf");
        args.push_back(filter.str());
        args.push_back("-vsync");
        args.push_back("vfr");
    }

    args.push_back(output);
    return args;
}

void FFmpegExtractionEngine::extract(const ExtractionRequest &request, const CancellationToken &cancel)
{
    std::vector<std::string> args = buildArguments(request);

    Logger::debug(std::string("ffmpeg ") + (request.mode == ExtractionMode::SINGLE_FRAME ? "single-frame" : "uniform") +
                  " extraction: " + request.source_path + " -> " + request.output_dir);

    ProcessResult result = ExternalProcess::run(ffmpeg_path_, args, cancel);

    if (result.cancelled)
    {
        cancel.throwIfCancelled("Frame extraction of " + request.source_path);
    }

    if (result.exit_code != 0)
    {
        std::string details = result.stderr_output.empty() ? "no diagnostics" : result.stderr_output;
        throw AnalysisError(ErrorKind::EXTERNAL_TOOL, SampleError::ExtractionFailed,
                            "ffmpeg " + std::string(request.mode == ExtractionMode::SINGLE_FRAME ? "(single frame)" : "(multi-frame)") +
                                " error, exit code " + std::to_string(result.exit_code) + ": " + details);
    }
}
