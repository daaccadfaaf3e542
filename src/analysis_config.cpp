#include "core/analysis_config.hpp"
#include "logging/logger.hpp"
#include <filesystem>

AnalysisConfig::AnalysisConfig()
    : poco_cfg_(PocoConfigManager::getInstance())
{
}

bool AnalysisConfig::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
    {
        Logger::warn("Configuration not loaded from " + file_path + ", using defaults");
        return false;
    }
    Logger::info("Configuration loaded from " + file_path);
    if (!validateConfig())
    {
        Logger::warn("Configuration in " + file_path + " has out-of-range values; affected settings fall back at use");
    }
    return true;
}

bool AnalysisConfig::saveConfig(const std::string &file_path) const
{
    return poco_cfg_.save(file_path);
}

void AnalysisConfig::updateConfig(const nlohmann::json &patch)
{
    poco_cfg_.update(patch);
}

nlohmann::json AnalysisConfig::getAll() const
{
    return poco_cfg_.getAll();
}

std::string AnalysisConfig::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

std::string AnalysisConfig::getLogFile() const
{
    return poco_cfg_.getString("logging.file", "");
}

int AnalysisConfig::getDefaultTargetFrames() const
{
    return poco_cfg_.getInt("analysis.default_target_frames", 30);
}

int AnalysisConfig::getMinTargetFrames() const
{
    return poco_cfg_.getInt("analysis.min_target_frames", 10);
}

int AnalysisConfig::getMaxTargetFrames() const
{
    return poco_cfg_.getInt("analysis.max_target_frames", 60);
}

double AnalysisConfig::getMaxShortDurationSeconds() const
{
    return poco_cfg_.getDouble("analysis.max_short_duration_seconds", 5.0);
}

int AnalysisConfig::getRunTimeoutSeconds() const
{
    return poco_cfg_.getInt("analysis.run_timeout_seconds", 300);
}

std::string AnalysisConfig::getWorkspaceRoot() const
{
    std::string def = (std::filesystem::temp_directory_path() / "motion_match_runs").string();
    return poco_cfg_.getString("workspace.root", def);
}

std::string AnalysisConfig::getFfmpegPath() const
{
    return poco_cfg_.getString("extraction.ffmpeg_path", "ffmpeg");
}

std::string AnalysisConfig::getFramePattern() const
{
    return poco_cfg_.getString("extraction.frame_pattern", "frame_%04d.png");
}

std::string AnalysisConfig::getPoseModelPath() const
{
    return poco_cfg_.getString("pose.model_path", "models/pose_landmark_full.onnx");
}

double AnalysisConfig::getMinDetectionConfidence() const
{
    return poco_cfg_.getDouble("pose.min_detection_confidence", 0.5);
}

bool AnalysisConfig::getPresenceIsLogit() const
{
    return poco_cfg_.getBool("pose.presence_is_logit", true);
}

int AnalysisConfig::getPoseMaxConcurrency() const
{
    int value = poco_cfg_.getInt("pose.max_concurrency", 1);
    return value < 1 ? 1 : value;
}

bool AnalysisConfig::validateConfig() const
{
    bool valid = true;

    if (!Logger::isValidLevel(getLogLevel()))
    {
        Logger::warn("Invalid log_level: " + getLogLevel());
        valid = false;
    }

    int min_frames = getMinTargetFrames();
    int max_frames = getMaxTargetFrames();
    int def_frames = getDefaultTargetFrames();
    if (min_frames <= 0 || max_frames < min_frames)
    {
        Logger::warn("Invalid target frame range [" + std::to_string(min_frames) + ", " + std::to_string(max_frames) + "]");
        valid = false;
    }
    if (def_frames < min_frames || def_frames > max_frames)
    {
        Logger::warn("Default target frames " + std::to_string(def_frames) + " outside configured range");
        valid = false;
    }

    if (getMaxShortDurationSeconds() <= 0.0)
    {
        Logger::warn("analysis.max_short_duration_seconds must be positive");
        valid = false;
    }

    if (getRunTimeoutSeconds() < 0)
    {
        Logger::warn("analysis.run_timeout_seconds must not be negative");
        valid = false;
    }

    double confidence = getMinDetectionConfidence();
    if (confidence < 0.0 || confidence > 1.0)
    {
        Logger::warn("pose.min_detection_confidence must be within [0, 1]");
        valid = false;
    }

    if (poco_cfg_.getInt("pose.max_concurrency", 1) < 1)
    {
        Logger::warn("pose.max_concurrency must be at least 1");
        valid = false;
    }

    return valid;
}
