/**
 * @file result_collector.hpp
 * @brief Maps raw termination facts to the result envelope
 *
 * **Mapping** (first match wins):
 * | Fact | Status | Error kind |
 * |------|--------|------------|
 * | sandbox failure | InfrastructureFailure | SandboxError |
 * | watchdog fired on time limit | TimedOut | TimeLimitExceeded |
 * | watchdog fired on cancellation | Killed | Cancelled |
 * | SIGXCPU (CPU backstop) | TimedOut | TimeLimitExceeded |
 * | OOM kill, or exit 137 | Crashed | MemoryLimitExceeded |
 * | exit 0 | Completed | None |
 * | other exit | Crashed | CompilationError / RuntimeError |
 * | other signal | Crashed | RuntimeError |
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/execution_driver.hpp"
#include "timebox/core/execution_types.hpp"
#include "timebox/core/resource_limiter.hpp"

#include <string>

namespace timebox {
namespace core {

enum class SandboxState;

/**
 * @class ResultCollector
 */
class ResultCollector {
public:
    /**
     * @brief Build the result for one execution
     * @param limits Limits the payload ran under (for messages)
     */
    static ExecutionResult Collect(const RawOutcome& raw, const EffectiveLimits& limits);

    /// Classify a failed run from its stderr (interpreter syntax errors, MemoryError)
    static ErrorKind DiagnoseFailure(const std::string& stderr_text);

    /// Lifecycle state an instance ends in for a given status
    static SandboxState TerminalState(ExecutionStatus status);
};

} // namespace core
} // namespace timebox
