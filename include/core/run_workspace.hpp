#pragma once

#include <optional>
#include <string>

/**
 * @brief Scratch directory exclusively owned by one analysis run
 *
 * The directory is named after a fresh UUID under the workspace root and
 * is removed with all of its contents exactly once, either by release()
 * or by the destructor.
 */
class RunWorkspace
{
public:
    /**
     * @brief Create a new run directory
     * @param root Workspace root, created if missing
     * @param id Directory name; a random UUID when empty
     * @throws AnalysisError RESOURCE when the directory cannot be created
     */
    explicit RunWorkspace(const std::string &root, const std::string &id = "");

    static std::string newRunId();
    ~RunWorkspace();

    RunWorkspace(const RunWorkspace &) = delete;
    RunWorkspace &operator=(const RunWorkspace &) = delete;

    const std::string &id() const { return id_; }
    const std::string &path() const { return path_; }

    /**
     * @brief Path of a child directory (not created)
     */
    std::string subdir(const std::string &name) const;

    /**
     * @brief Remove the directory tree
     * @return Error message when removal failed, std::nullopt otherwise.
     *         Calls after the first are no-ops.
     */
    std::optional<std::string> release();

    bool released() const { return released_; }

private:
    std::string id_;
    std::string path_;
    bool released_ = false;
};
