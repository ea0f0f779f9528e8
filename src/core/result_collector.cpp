/**
 * @file result_collector.cpp
 * @brief Implementation of the termination → result mapping
 *
 * @date 2025
 */

#include "timebox/core/result_collector.hpp"
#include "timebox/core/sandbox_manager.hpp"
#include "timebox/utils/string_utils.hpp"

#include <signal.h>
#include <string.h>

namespace timebox {
namespace core {

namespace {

constexpr int kOomExitCode = 137;

std::string SignalName(int signal) {
    const char* description = strsignal(signal);
    return description ? description : "signal " + std::to_string(signal);
}

} // anonymous namespace

ErrorKind ResultCollector::DiagnoseFailure(const std::string& stderr_text) {
    using utils::StringUtils;

    if (StringUtils::Contains(stderr_text, "SyntaxError:") ||
        StringUtils::Contains(stderr_text, "IndentationError:") ||
        StringUtils::Contains(stderr_text, "TabError:")) {
        return ErrorKind::COMPILATION_ERROR;
    }
    if (StringUtils::Contains(stderr_text, "MemoryError")) {
        return ErrorKind::MEMORY_LIMIT_EXCEEDED;
    }
    return ErrorKind::RUNTIME_ERROR;
}

ExecutionResult ResultCollector::Collect(const RawOutcome& raw, const EffectiveLimits& limits) {
    ExecutionResult result;
    result.stdout_stream = raw.stdout_stream;
    result.stderr_stream = raw.stderr_stream;
    result.duration = raw.duration;
    result.max_memory_kb = raw.engine_info.max_memory_kb;
    if (!result.max_memory_kb && raw.payload_is_client && raw.exit_status) {
        result.max_memory_kb = raw.exit_status->max_rss_kb;
    }

    if (raw.infrastructure_error) {
        result.status = ExecutionStatus::INFRASTRUCTURE_FAILURE;
        result.error_kind = ErrorKind::SANDBOX_ERROR;
        result.message = *raw.infrastructure_error;
        return result;
    }

    // Recorded before any signal was sent, so it wins a race with a normal exit
    if (raw.reason == TerminationReason::TIMEOUT) {
        result.status = ExecutionStatus::TIMED_OUT;
        result.timed_out = true;
        result.error_kind = ErrorKind::TIME_LIMIT_EXCEEDED;
        result.message = "Time limit of " + std::to_string(limits.time_limit.count()) +
                         " ms exceeded";
        if (raw.exit_status && !raw.exit_status->exited && raw.payload_is_client) {
            result.term_signal = raw.exit_status->term_signal;
        }
        return result;
    }

    if (raw.reason == TerminationReason::CANCELLED) {
        result.status = ExecutionStatus::KILLED;
        result.error_kind = ErrorKind::CANCELLED;
        result.message = raw.started ? "Cancelled while running" : "Cancelled before start";
        return result;
    }

    if (!raw.exit_status) {
        result.status = ExecutionStatus::INFRASTRUCTURE_FAILURE;
        result.error_kind = ErrorKind::SANDBOX_ERROR;
        result.message = "No exit status was observed";
        return result;
    }

    const utils::ExitStatus& status = *raw.exit_status;

    if (!status.exited && status.term_signal == SIGXCPU) {
        result.status = ExecutionStatus::TIMED_OUT;
        result.timed_out = true;
        result.term_signal = SIGXCPU;
        result.error_kind = ErrorKind::TIME_LIMIT_EXCEEDED;
        result.message = "CPU time limit exceeded";
        return result;
    }

    int exit_code = raw.engine_info.exit_code.value_or(status.exit_code);
    if (!status.exited && raw.payload_is_client) {
        result.term_signal = status.term_signal;
    }

    if (raw.engine_info.oom_killed || exit_code == kOomExitCode) {
        result.status = ExecutionStatus::CRASHED;
        result.exit_code = exit_code;
        result.error_kind = ErrorKind::MEMORY_LIMIT_EXCEEDED;
        result.message = "Memory limit of " + std::to_string(limits.memory_limit_mb) +
                         " MB exceeded";
        return result;
    }

    if (exit_code == 0) {
        result.status = ExecutionStatus::COMPLETED;
        result.exit_code = 0;
        result.term_signal.reset();
        result.message = "Exited normally";
        return result;
    }

    result.status = ExecutionStatus::CRASHED;
    result.exit_code = exit_code;
    if (result.term_signal) {
        result.error_kind = ErrorKind::RUNTIME_ERROR;
        result.message = "Terminated by " + SignalName(*result.term_signal);
        if (*result.term_signal == SIGXFSZ) {
            result.message += " (file size limit)";
        }
    } else {
        result.error_kind = DiagnoseFailure(result.stderr_stream.data);
        result.message = "Exited with code " + std::to_string(exit_code);
    }

    return result;
}

SandboxState ResultCollector::TerminalState(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return SandboxState::COMPLETED;
        case ExecutionStatus::TIMED_OUT: return SandboxState::TIMED_OUT;
        case ExecutionStatus::CRASHED: return SandboxState::CRASHED;
        case ExecutionStatus::KILLED: return SandboxState::KILLED;
        case ExecutionStatus::INFRASTRUCTURE_FAILURE: return SandboxState::RECLAIMED;
    }
    return SandboxState::RECLAIMED;
}

} // namespace core
} // namespace timebox
