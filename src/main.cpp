#include "core/analysis_config.hpp"
#include "core/analysis_result.hpp"
#include "core/dnn_pose_estimator.hpp"
#include "core/extraction_engine.hpp"
#include "core/metadata_probe.hpp"
#include "core/run_coordinator.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Motion Match - pose similarity between two videos" << std::endl;
        std::cout << "Usage: " << program << " --short <file> --reference <file> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --short <file>             Short clip to evaluate" << std::endl;
        std::cout << "  --reference <file>         Reference clip" << std::endl;
        std::cout << "  --frames <n>               Frames sampled per video (10-60, otherwise the default)" << std::endl;
        std::cout << "  --max-short-seconds <s>    Maximum duration of the short clip" << std::endl;
        std::cout << "  --config <file>            JSON configuration file (default: config.json)" << std::endl;
        std::cout << "  --log-level <level>        TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --owns-sources             Delete both source files when the run ends" << std::endl;
        std::cout << "  --help, -h                 Show this help message" << std::endl;
    }

    bool parseInt(const std::string &text, int &value)
    {
        try
        {
            size_t used = 0;
            value = std::stoi(text, &used);
            return used == text.size();
        }
        catch (const std::exception &)
        {
            return false;
        }
    }

    bool parseDouble(const std::string &text, double &value)
    {
        try
        {
            size_t used = 0;
            value = std::stod(text, &used);
            return used == text.size();
        }
        catch (const std::exception &)
        {
            return false;
        }
    }
}

int main(int argc, char *argv[])
{
    std::string short_video;
    std::string reference_video;
    std::string config_path;
    std::string log_level;
    std::string frames_arg;
    std::string max_short_arg;
    bool owns_sources = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto next = [&](std::string &target)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--short")
        {
            if (!next(short_video))
                return 2;
        }
        else if (arg == "--reference")
        {
            if (!next(reference_video))
                return 2;
        }
        else if (arg == "--frames")
        {
            if (!next(frames_arg))
                return 2;
        }
        else if (arg == "--max-short-seconds")
        {
            if (!next(max_short_arg))
                return 2;
        }
        else if (arg == "--config")
        {
            if (!next(config_path))
                return 2;
        }
        else if (arg == "--log-level")
        {
            if (!next(log_level))
                return 2;
        }
        else if (arg == "--owns-sources")
        {
            owns_sources = true;
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (short_video.empty() || reference_video.empty())
    {
        std::cerr << "Error: --short and --reference are required" << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    auto &config = AnalysisConfig::getInstance();
    if (!config_path.empty())
    {
        if (!config.loadConfig(config_path))
        {
            std::cerr << "Error: could not load configuration " << config_path << std::endl;
            return 2;
        }
    }
    else if (std::filesystem::exists("config.json"))
    {
        config.loadConfig("config.json");
    }

    Logger::init(log_level.empty() ? config.getLogLevel() : log_level, config.getLogFile());

    AnalysisRequest request;
    request.short_video = short_video;
    request.reference_video = reference_video;
    request.owns_sources = owns_sources;
    request.max_short_duration_seconds = config.getMaxShortDurationSeconds();
    request.target_frames = config.getDefaultTargetFrames();

    if (!frames_arg.empty())
    {
        int requested = 0;
        if (!parseInt(frames_arg, requested))
        {
            Logger::warn("Ignoring non-numeric --frames value: " + frames_arg);
            requested = config.getDefaultTargetFrames();
        }
        request.target_frames = AnalysisRequest::normalizeTargetFrames(
            requested, config.getMinTargetFrames(), config.getMaxTargetFrames(), config.getDefaultTargetFrames());
        if (request.target_frames != requested)
        {
            Logger::warn("Requested " + std::to_string(requested) + " frames is out of range, using " +
                         std::to_string(request.target_frames));
        }
    }

    if (!max_short_arg.empty() && !parseDouble(max_short_arg, request.max_short_duration_seconds))
    {
        std::cerr << "Error: invalid --max-short-seconds value " << max_short_arg << std::endl;
        return 2;
    }

    FFmpegMetadataProbe probe;
    FFmpegExtractionEngine engine(config.getFfmpegPath());

    DnnPoseEstimator::Options pose_options;
    pose_options.model_path = config.getPoseModelPath();
    pose_options.min_detection_confidence = config.getMinDetectionConfidence();
    pose_options.presence_is_logit = config.getPresenceIsLogit();
    DnnPoseEstimator estimator(pose_options);

    RunCoordinator coordinator(probe, engine, estimator, RunCoordinator::Settings::fromConfig(config));

    // SIGINT/SIGTERM cancel the run; cleanup still happens before exit
    CancellationToken cancel;
    auto &shutdown = ShutdownManager::getInstance();
    shutdown.setShutdownCallback([cancel](const std::string &reason) mutable
                                 { cancel.cancel(reason); });
    shutdown.installSignalHandlers();

    AnalysisResult result = coordinator.runAnalysis(request, cancel);
    shutdown.restoreSignalHandlers();

    std::cout << result.toJson().dump(2) << std::endl;
    return result.success ? 0 : ErrorKinds::getExitCode(result.error_kind);
}
