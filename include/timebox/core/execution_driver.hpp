/**
 * @file execution_driver.hpp
 * @brief Runs one payload inside a leased sandbox
 *
 * Writes the code into the instance's working directory, starts it through
 * the engine under a watchdog, pumps bounded stdout/stderr while feeding
 * stdin, and reports the raw termination facts. Interpretation of those
 * facts is left to ResultCollector.
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/execution_types.hpp"
#include "timebox/core/resource_limiter.hpp"
#include "timebox/core/sandbox_lease.hpp"
#include "timebox/utils/container_utils.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace timebox {
namespace core {

/**
 * @struct RawOutcome
 * @brief Uninterpreted facts about one execution
 */
struct RawOutcome {
    bool started{false};                          ///< The payload process was started
    std::optional<utils::ExitStatus> exit_status; ///< Wait status of the started process
    utils::EngineExitInfo engine_info;            ///< Engine-side facts
    bool payload_is_client{false};                ///< exit_status describes the payload itself
    TerminationReason reason{TerminationReason::NONE};
    CapturedStream stdout_stream;
    CapturedStream stderr_stream;
    std::chrono::milliseconds duration{0};
    std::optional<std::string> infrastructure_error;  ///< Set when the sandbox failed
};

/**
 * @class ExecutionDriver
 */
class ExecutionDriver {
public:
    explicit ExecutionDriver(utils::ContainerEngine& engine);

    /**
     * @brief Run the request's code in the leased instance
     *
     * Never throws for payload behaviour; sandbox failures are reported in
     * RawOutcome::infrastructure_error. Moves the lease to RUNNING only once
     * the process has actually started.
     *
     * @param token Optional cancellation; already cancelled means nothing runs
     */
    RawOutcome Execute(SandboxLease& lease,
                       const ExecutionRequest& request,
                       CancellationToken* token);

private:
    void InjectPayload(const SandboxLease& lease, const std::string& code) const;

    utils::ContainerEngine& engine_;
};

} // namespace core
} // namespace timebox
