/**
 * @file execution_types.hpp
 * @brief Request and result envelopes of a sandboxed execution
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace timebox {
namespace core {

/**
 * @enum ExecutionStatus
 * @brief Final outcome of one execution
 */
enum class ExecutionStatus {
    COMPLETED,              ///< Exited 0 within the time limit
    TIMED_OUT,              ///< Stopped by the watchdog (or the CPU backstop)
    CRASHED,                ///< Non-zero exit or a signal not sent by us
    KILLED,                 ///< Cancelled by the caller
    INFRASTRUCTURE_FAILURE  ///< The sandbox itself failed; the code never ran
};

/**
 * @enum ErrorKind
 * @brief Finer diagnosis of a non-successful execution
 */
enum class ErrorKind {
    NONE,
    COMPILATION_ERROR,      ///< Interpreter rejected the source (SyntaxError...)
    RUNTIME_ERROR,          ///< Program failed while running
    MEMORY_LIMIT_EXCEEDED,  ///< OOM-killed by the engine
    TIME_LIMIT_EXCEEDED,    ///< Watchdog or CPU limit expired
    CANCELLED,              ///< Caller cancelled the run
    SANDBOX_ERROR           ///< Provisioning or engine failure
};

/**
 * @struct ExecutionRequest
 * @brief One code payload plus the limits it must run under
 *
 * Unset optionals fall back to the runner configuration defaults.
 */
struct ExecutionRequest {
    std::string code;                                  ///< Source text to execute
    std::string runtime;                               ///< Runtime profile name (empty = default)
    std::optional<std::chrono::milliseconds> time_limit;  ///< Wall-clock ceiling
    std::optional<std::size_t> memory_limit_mb;        ///< Memory ceiling
    std::optional<double> cpu_limit;                   ///< CPU cores
    std::map<std::string, std::string> environment;    ///< Extra environment variables
    std::string stdin_data;                            ///< Fed to standard input
    std::string request_id;                            ///< Caller correlation tag, echoed back
};

/**
 * @struct CapturedStream
 * @brief One size-capped output stream
 */
struct CapturedStream {
    std::string data;           ///< At most cap bytes
    bool truncated{false};      ///< Bytes past the cap were dropped
    std::size_t total_bytes{0}; ///< Bytes the program actually wrote
};

/**
 * @struct ExecutionResult
 * @brief Result envelope handed back to the caller exactly once
 */
struct ExecutionResult {
    std::string request_id;                  ///< Echo of ExecutionRequest::request_id
    std::string sandbox_id;                  ///< Instance that ran the code
    ExecutionStatus status{ExecutionStatus::INFRASTRUCTURE_FAILURE};
    CapturedStream stdout_stream;
    CapturedStream stderr_stream;
    std::optional<int> exit_code;            ///< Set for COMPLETED and CRASHED only
    std::optional<int> term_signal;          ///< Signal that ended the process
    std::chrono::milliseconds duration{0};   ///< Wall-clock time from start to exit
    bool timed_out{false};
    ErrorKind error_kind{ErrorKind::NONE};
    std::optional<std::size_t> max_memory_kb;  ///< Peak resident set, when measurable
    std::string message;                     ///< Human readable diagnosis
    std::string code_sha256;                 ///< Fingerprint of the payload
};

/// Contract spelling of a status ("Completed", "TimedOut", ...)
std::string StatusToString(ExecutionStatus status);

/// Contract spelling of an error kind ("CompilationError", ...)
std::string ErrorKindToString(ErrorKind kind);

} // namespace core
} // namespace timebox
