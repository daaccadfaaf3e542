#include "core/external_process.hpp"
#include "core/analysis_error.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <cerrno>
#include <memory>
#include <sys/wait.h>
#include <thread>

namespace
{
    int exitCodeFromStatus(int status)
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }
}

ProcessResult ExternalProcess::run(const std::string &command,
                                   const std::vector<std::string> &args,
                                   const CancellationToken &cancel,
                                   std::chrono::milliseconds poll_interval)
{
    cancel.throwIfCancelled("Launch of " + command);

    std::string command_line = command;
    for (const auto &arg : args)
        command_line += " " + arg;
    Logger::debug("Spawning: " + command_line);

    Poco::Pipe err_pipe;
    Poco::Process::Args process_args(args.begin(), args.end());

    std::unique_ptr<Poco::ProcessHandle> handle;
    try
    {
        handle = std::make_unique<Poco::ProcessHandle>(
            Poco::Process::launch(command, process_args, nullptr, nullptr, &err_pipe));
    }
    catch (const Poco::Exception &e)
    {
        throw AnalysisError(ErrorKind::EXTERNAL_TOOL, SampleError::ExtractionFailed,
                            "Failed to start " + command + ": " + e.displayText());
    }

    // Drain stderr on a separate thread so a chatty child never blocks on a full pipe.
    // The stream reaches EOF once the child exits and its write end is closed.
    std::string diagnostics;
    std::thread drain([&err_pipe, &diagnostics]()
                      {
        Poco::PipeInputStream err_stream(err_pipe);
        std::string line;
        while (std::getline(err_stream, line))
        {
            diagnostics += line;
            diagnostics += '\n';
            if (diagnostics.size() > 2 * kMaxDiagnosticBytes)
                diagnostics.erase(0, diagnostics.size() - kMaxDiagnosticBytes);
        } });

    ProcessResult result;
    const pid_t pid = static_cast<pid_t>(handle->id());
    int status = 0;
    bool reaped = false;

    while (!reaped)
    {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid)
        {
            reaped = true;
            result.exit_code = exitCodeFromStatus(status);
            break;
        }
        if (rc < 0 && errno != EINTR)
        {
            Logger::warn("Lost track of " + command + " (pid " + std::to_string(pid) + ")");
            break;
        }

        if (cancel.isCancelled())
        {
            Logger::warn("Cancelling external process " + command + " (pid " + std::to_string(pid) + "): " + cancel.reason());
            try
            {
                Poco::Process::kill(*handle);
            }
            catch (const Poco::Exception &e)
            {
                Logger::warn("Failed to kill " + command + ": " + e.displayText());
            }
            result.cancelled = true;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }
            result.exit_code = exitCodeFromStatus(status);
            reaped = true;
            break;
        }
        std::this_thread::sleep_for(poll_interval);
    }

    drain.join();

    if (diagnostics.size() > kMaxDiagnosticBytes)
        diagnostics.erase(0, diagnostics.size() - kMaxDiagnosticBytes);
    result.stderr_output = diagnostics;

    Logger::debug(command + " exited with code " + std::to_string(result.exit_code));
    return result;
}
