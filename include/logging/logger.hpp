#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <memory>
#include <string>
#include <utility>

/**
 * @brief Process wide logging facade over a single spdlog logger
 *
 * Messages go to stderr so stdout stays free for the JSON result.
 */
class Logger
{
public:
    /**
     * @brief Configure the shared logger
     * @param log_level One of TRACE, DEBUG, INFO, WARN, ERROR (case sensitive)
     * @param log_file Optional file that receives a copy of every message
     *
     * Calling init again replaces the file sink; an empty log_file removes it.
     */
    static void init(const std::string &log_level = "INFO", const std::string &log_file = "")
    {
        auto logger = getLogger();
        auto &file_sink = fileSink();

        if (file_sink && file_sink->filename() != log_file)
        {
            auto &sinks = logger->sinks();
            sinks.erase(std::remove(sinks.begin(), sinks.end(), file_sink), sinks.end());
            file_sink.reset();
        }

        if (!log_file.empty() && !file_sink)
        {
            try
            {
                file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
                logger->sinks().push_back(file_sink);
            }
            catch (const spdlog::spdlog_ex &e)
            {
                logger->warn("Could not open log file {}: {}", log_file, e.what());
            }
        }

        setLevel(log_level);
    }

    static void setLevel(const std::string &log_level)
    {
        spdlog::level::level_enum level = spdlog::level::info;
        if (!parseLevel(log_level, level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
        getLogger()->set_level(level);
    }

    static bool isValidLevel(const std::string &log_level)
    {
        spdlog::level::level_enum unused;
        return parseLevel(log_level, unused);
    }

    static void trace(const std::string &message) { getLogger()->trace(message); }
    static void debug(const std::string &message) { getLogger()->debug(message); }
    static void info(const std::string &message) { getLogger()->info(message); }
    static void warn(const std::string &message) { getLogger()->warn(message); }
    static void error(const std::string &message) { getLogger()->error(message); }

    static void flush() { getLogger()->flush(); }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = []
        {
            auto created = spdlog::stderr_color_mt("motion_match");
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            return created;
        }();
        return logger;
    }

    static std::shared_ptr<spdlog::sinks::basic_file_sink_mt> &fileSink()
    {
        static std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
        return sink;
    }

    static bool parseLevel(const std::string &log_level, spdlog::level::level_enum &level)
    {
        static const std::pair<const char *, spdlog::level::level_enum> kLevels[] = {
            {"TRACE", spdlog::level::trace},
            {"DEBUG", spdlog::level::debug},
            {"INFO", spdlog::level::info},
            {"WARN", spdlog::level::warn},
            {"ERROR", spdlog::level::err}};

        for (const auto &entry : kLevels)
        {
            if (log_level == entry.first)
            {
                level = entry.second;
                return true;
            }
        }
        return false;
    }
};
