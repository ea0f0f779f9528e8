/**
 * @file json_reporter.hpp
 * @brief JSON request parsing and result serialization
 *
 * The wire contract of the CLI and of anything embedding the runner:
 *
 * **Request**:
 * ```json
 * {"id": "r1", "code": "print(1)", "runtime": "python", "timeLimitMs": 2000,
 *  "memoryLimitMb": 128, "cpuLimit": 0.5, "env": {"K": "V"}, "stdin": "..."}
 * ```
 * Only `code` is required.
 *
 * **Result**:
 * ```json
 * {"id": "r1", "sandboxId": "timebox_...", "status": "Completed",
 *  "stdout": "1\n", "stdoutTruncated": false, "stderr": "", "stderrTruncated": false,
 *  "exitCode": 0, "termSignal": null, "durationMs": 41, "timedOut": false,
 *  "errorKind": "None", "maxMemoryKb": 9120, "message": "Exited normally",
 *  "codeSha256": "..."}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/execution_types.hpp"
#include "timebox/core/image_registry.hpp"
#include "timebox/core/runner_config.hpp"

#include <string>
#include <vector>

namespace timebox {
namespace reporters {

/**
 * @struct JsonReporterConfig
 */
struct JsonReporterConfig {
    int indent{-1};                 ///< -1 = single line (NDJSON friendly)
    bool include_stream_sizes{false};  ///< Add stdoutBytes / stderrBytes totals
};

/**
 * @class JsonReporter
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Parse one request document
     * @throws core::InvalidRequestError on malformed JSON, a missing `code`,
     *         wrongly typed fields or a non-positive `timeLimitMs`
     */
    static core::ExecutionRequest ParseRequest(const std::string& json_text);

    /// Serialize a result
    std::string GenerateResultJson(const core::ExecutionResult& result) const;

    /**
     * @brief Serialize a signalled error (rejection, invalid request)
     * @param error Short error class ("AdmissionRejected", "InvalidRequest", ...)
     */
    std::string GenerateErrorJson(const std::string& error,
                                  const std::string& message,
                                  const std::string& request_id = "") const;

    /// Resolved runtimes plus the effective configuration (for `check`)
    std::string GenerateCheckJson(const core::RunnerConfig& config,
                                  const std::vector<core::ImageHandle>& images,
                                  const std::string& engine_name) const;

private:
    std::string FormatTimestamp(const std::chrono::system_clock::time_point& time) const;

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace timebox
