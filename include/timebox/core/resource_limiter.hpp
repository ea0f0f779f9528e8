/**
 * @file resource_limiter.hpp
 * @brief Limit resolution, the wall-clock watchdog and cancellation
 *
 * ResourceLimiter turns a request plus the runner configuration into the
 * effective limits of one execution. The Watchdog enforces the wall-clock
 * part: when the limit expires (or the caller cancels) it records why,
 * sends SIGTERM, waits the grace window and then sends SIGKILL.
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/execution_types.hpp"
#include "timebox/core/runner_config.hpp"
#include "timebox/utils/container_utils.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace timebox {
namespace core {

/**
 * @struct EffectiveLimits
 * @brief Limits one execution actually runs under
 */
struct EffectiveLimits {
    std::chrono::milliseconds time_limit{0};
    std::chrono::milliseconds termination_grace{0};
    std::size_t memory_limit_mb{0};
    double cpu_limit{0.0};
    int pids_limit{0};
    std::size_t max_file_size_mb{0};
    bool network_enabled{false};
    std::size_t stdout_cap_bytes{0};
    std::size_t stderr_cap_bytes{0};
};

/**
 * @class ResourceLimiter
 * @brief Validates requested limits against the configured bounds
 */
class ResourceLimiter {
public:
    explicit ResourceLimiter(const RunnerConfig& config);

    /**
     * @brief Merge request overrides with defaults and validate
     * @throws InvalidRequestError for non-positive or out-of-range limits,
     *         or environment names that are not valid identifiers
     */
    EffectiveLimits Resolve(const ExecutionRequest& request) const;

    /// Copy engine-enforced limits onto a provision spec
    static void ApplyTo(const EffectiveLimits& limits, utils::ProvisionSpec& spec);

private:
    const RunnerConfig& config_;
};

/**
 * @enum TerminationReason
 * @brief Why the watchdog fired
 */
enum class TerminationReason {
    NONE,       ///< Never fired
    TIMEOUT,    ///< Wall-clock limit expired
    CANCELLED   ///< Caller cancelled
};

/**
 * @class Watchdog
 * @brief Wall-clock limit enforcement for one running payload
 *
 * The reason is recorded before any signal is delivered, so an exit racing
 * the deadline is always reported as a timeout.
 *
 * **Usage Example**:
 * @code
 * Watchdog watchdog(limits.time_limit, limits.termination_grace,
 *                   [&](int sig) { engine.Signal(id, *client, sig); });
 * watchdog.Arm();
 * auto status = client->Wait();
 * watchdog.Disarm();
 * if (watchdog.Reason() == TerminationReason::TIMEOUT) { ... }
 * @endcode
 */
class Watchdog {
public:
    using Terminator = std::function<void(int signal)>;

    Watchdog(std::chrono::milliseconds limit,
             std::chrono::milliseconds grace,
             Terminator terminator);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    /// Start the clock; call at most once
    void Arm();

    /// Stop the clock and join the thread; no signals are sent afterwards
    void Disarm();

    /// Fire now with CANCELLED (or immediately on Arm if not yet armed)
    void Cancel();

    TerminationReason Reason() const;
    bool Tripped() const;

    /**
     * @brief The payload ignored both signals for two grace windows
     *
     * Used to abandon stream capture when the process cannot be reaped.
     */
    bool HardStopReached() const;

private:
    void Loop();

    std::chrono::milliseconds limit_;
    std::chrono::milliseconds grace_;
    Terminator terminator_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool armed_{false};
    bool stop_{false};
    bool cancel_requested_{false};
    TerminationReason reason_{TerminationReason::NONE};
    std::chrono::steady_clock::time_point deadline_;
    std::chrono::steady_clock::time_point tripped_at_;
};

/**
 * @class CancellationToken
 * @brief Caller-side handle to cancel a run
 *
 * Cancelling before the payload starts makes the run end as KILLED without
 * executing anything.
 */
class CancellationToken {
public:
    void Cancel();
    bool IsCancelled() const;

    /// Route future (and already requested) cancellation to a watchdog
    void Attach(Watchdog* watchdog);
    void Detach();

private:
    mutable std::mutex mutex_;
    bool cancelled_{false};
    Watchdog* watchdog_{nullptr};
};

std::string TerminationReasonToString(TerminationReason reason);

} // namespace core
} // namespace timebox
