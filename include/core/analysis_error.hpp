#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error classification surfaced to callers of the analysis pipeline
 */
enum class ErrorKind
{
    NONE,
    VALIDATION,    // User-correctable input problem, never retried
    EXTERNAL_TOOL, // Probe, extraction or inference engine failure, may be transient
    INTEGRITY,     // A pipeline invariant was broken
    RESOURCE,      // Workspace creation or cleanup failure
    CANCELLED      // Caller abort or run timeout
};

class ErrorKinds
{
public:
    static std::string getName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::VALIDATION:
            return "VALIDATION";
        case ErrorKind::EXTERNAL_TOOL:
            return "EXTERNAL_TOOL";
        case ErrorKind::INTEGRITY:
            return "INTEGRITY";
        case ErrorKind::RESOURCE:
            return "RESOURCE";
        case ErrorKind::CANCELLED:
            return "CANCELLED";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Process exit code used by the command-line entry point
     */
    static int getExitCode(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::NONE:
            return 0;
        case ErrorKind::VALIDATION:
            return 2;
        case ErrorKind::EXTERNAL_TOOL:
            return 3;
        case ErrorKind::INTEGRITY:
            return 4;
        case ErrorKind::RESOURCE:
            return 5;
        case ErrorKind::CANCELLED:
            return 6;
        default:
            return 1;
        }
    }
};

/**
 * @brief Exception thrown inside the pipeline; carries a kind and a stable code
 */
class AnalysisError : public std::runtime_error
{
public:
    AnalysisError(ErrorKind kind, const std::string &code, const std::string &message)
        : std::runtime_error(message), kind_(kind), code_(code) {}

    ErrorKind kind() const { return kind_; }
    const std::string &code() const { return code_; }

private:
    ErrorKind kind_;
    std::string code_;
};

// Stable error codes reported by MetadataProbe
namespace ProbeError
{
    const char *const NoVideoStream = "PROBE_NO_VIDEO_STREAM";
    const char *const OpenFailed = "PROBE_OPEN_FAILED";
}

// Stable error codes reported by FrameSampler
namespace SampleError
{
    const char *const InvalidTargetCount = "SAMPLE_INVALID_TARGET_COUNT";
    const char *const SourceNotFound = "SAMPLE_SOURCE_NOT_FOUND";
    const char *const NoFramesProduced = "SAMPLE_NO_FRAMES_PRODUCED";
    const char *const ExtractionFailed = "SAMPLE_EXTRACTION_FAILED";
}

// Stable error codes reported by the run coordinator
namespace RunError
{
    const char *const DurationLimitExceeded = "RUN_DURATION_LIMIT_EXCEEDED";
    const char *const SequenceLengthMismatch = "RUN_SEQUENCE_LENGTH_MISMATCH";
    const char *const WorkspaceUnavailable = "RUN_WORKSPACE_UNAVAILABLE";
    const char *const CleanupFailed = "RUN_CLEANUP_FAILED";
    const char *const Cancelled = "RUN_CANCELLED";
    const char *const TimedOut = "RUN_TIMED_OUT";
    const char *const EstimatorUnavailable = "RUN_ESTIMATOR_UNAVAILABLE";
    const char *const Internal = "RUN_INTERNAL_ERROR";
}
