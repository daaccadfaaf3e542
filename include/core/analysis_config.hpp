#pragma once

#include "core/poco_config_manager.hpp"
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Typed view over the analysis settings held by PocoConfigManager
 *
 * Every getter has a built-in default so the pipeline runs without any
 * configuration file present.
 */
class AnalysisConfig
{
public:
    static AnalysisConfig &getInstance()
    {
        static AnalysisConfig instance;
        return instance;
    }

    /**
     * @brief Load a JSON configuration file
     * @param file_path Path of the file to load
     * @return true if the file was read and parsed
     */
    bool loadConfig(const std::string &file_path);

    bool saveConfig(const std::string &file_path) const;

    void updateConfig(const nlohmann::json &patch);

    nlohmann::json getAll() const;

    // Logging
    std::string getLogLevel() const;
    std::string getLogFile() const;

    // Target frame policy
    int getDefaultTargetFrames() const;
    int getMinTargetFrames() const;
    int getMaxTargetFrames() const;

    // Run limits
    double getMaxShortDurationSeconds() const;
    int getRunTimeoutSeconds() const;

    // Workspace
    std::string getWorkspaceRoot() const;

    // Extraction engine
    std::string getFfmpegPath() const;
    std::string getFramePattern() const;

    // Pose estimation
    std::string getPoseModelPath() const;
    double getMinDetectionConfidence() const;
    bool getPresenceIsLogit() const;
    int getPoseMaxConcurrency() const;

    /**
     * @brief Check value ranges of the current configuration
     * @return true if every value is usable
     */
    bool validateConfig() const;

private:
    AnalysisConfig();
    AnalysisConfig(const AnalysisConfig &) = delete;
    AnalysisConfig &operator=(const AnalysisConfig &) = delete;

    PocoConfigManager &poco_cfg_;
};
