#pragma once

#include "core/cancellation_token.hpp"
#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Outcome of one external process invocation
 */
struct ProcessResult
{
    int exit_code = -1;
    bool cancelled = false;
    std::string stderr_output; // Tail of the process diagnostics
};

/**
 * @brief Runs an external executable and keeps it abortable
 *
 * The child is polled while it runs; when the token is cancelled (or its
 * deadline passes) the child is killed and reaped before returning.
 */
class ExternalProcess
{
public:
    static constexpr size_t kMaxDiagnosticBytes = 8192;

    /**
     * @brief Launch a command and wait for it
     * @param command Executable name or path (resolved through PATH)
     * @param args Command arguments
     * @param cancel Token observed while the process runs
     * @param poll_interval Delay between liveness checks
     * @return ProcessResult with exit code and captured stderr tail
     * @throws AnalysisError EXTERNAL_TOOL if the process cannot be started
     */
    static ProcessResult run(const std::string &command,
                             const std::vector<std::string> &args,
                             const CancellationToken &cancel,
                             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
};
