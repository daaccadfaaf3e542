#include "core/run_workspace.hpp"
#include "core/analysis_error.hpp"
#include "logging/logger.hpp"
#include <Poco/UUIDGenerator.h>
#include <filesystem>

namespace fs = std::filesystem;

std::string RunWorkspace::newRunId()
{
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

RunWorkspace::RunWorkspace(const std::string &root, const std::string &id)
    : id_(id.empty() ? newRunId() : id)
{
    path_ = (fs::path(root) / id_).string();

    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec)
    {
        throw AnalysisError(ErrorKind::RESOURCE, RunError::WorkspaceUnavailable,
                            "Failed to create run workspace " + path_ + ": " + ec.message());
    }
    Logger::debug("RunID " + id_ + ": workspace created at " + path_);
}

RunWorkspace::~RunWorkspace()
{
    auto error = release();
    if (error)
    {
        Logger::error("RunID " + id_ + ": " + *error);
    }
}

std::string RunWorkspace::subdir(const std::string &name) const
{
    return (fs::path(path_) / name).string();
}

std::optional<std::string> RunWorkspace::release()
{
    if (released_)
    {
        return std::nullopt;
    }
    released_ = true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        return "Failed to remove run workspace " + path_ + ": " + ec.message();
    }
    Logger::debug("RunID " + id_ + ": workspace removed");
    return std::nullopt;
}
