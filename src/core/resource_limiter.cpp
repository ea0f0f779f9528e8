/**
 * @file resource_limiter.cpp
 * @brief Implementation of limit resolution, watchdog and cancellation
 *
 * **Watchdog Timeline**:
 * ```
 * Arm ──── limit ────▶ reason recorded, SIGTERM ── grace ──▶ SIGKILL ── grace ──▶ hard stop
 *   └─ Disarm at any point stops the sequence
 * ```
 *
 * @date 2025
 */

#include "timebox/core/resource_limiter.hpp"
#include "timebox/core/errors.hpp"
#include "timebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

namespace timebox {
namespace core {

// ============================================================================
// RESOURCE LIMITER
// ============================================================================

ResourceLimiter::ResourceLimiter(const RunnerConfig& config)
    : config_(config) {
}

EffectiveLimits ResourceLimiter::Resolve(const ExecutionRequest& request) const {
    EffectiveLimits limits;

    limits.time_limit = request.time_limit.value_or(config_.default_time_limit);
    if (limits.time_limit.count() <= 0) {
        throw InvalidRequestError("Time limit must be > 0 ms");
    }
    if (limits.time_limit > config_.max_time_limit) {
        throw InvalidRequestError("Time limit " + std::to_string(limits.time_limit.count()) +
                                  " ms exceeds the maximum of " +
                                  std::to_string(config_.max_time_limit.count()) + " ms");
    }

    limits.memory_limit_mb = request.memory_limit_mb.value_or(config_.default_memory_limit_mb);
    if (limits.memory_limit_mb == 0) {
        throw InvalidRequestError("Memory limit must be > 0 MB");
    }
    if (limits.memory_limit_mb > config_.max_memory_limit_mb) {
        throw InvalidRequestError("Memory limit " + std::to_string(limits.memory_limit_mb) +
                                  " MB exceeds the maximum of " +
                                  std::to_string(config_.max_memory_limit_mb) + " MB");
    }

    limits.cpu_limit = request.cpu_limit.value_or(config_.default_cpu_limit);
    if (limits.cpu_limit <= 0.0) {
        throw InvalidRequestError("CPU limit must be > 0");
    }

    for (const auto& [name, value] : request.environment) {
        if (!utils::StringUtils::IsValidEnvName(name)) {
            throw InvalidRequestError("Invalid environment variable name '" + name + "'");
        }
    }

    limits.termination_grace = config_.termination_grace;
    limits.pids_limit = config_.pids_limit;
    limits.max_file_size_mb = config_.max_file_size_mb;
    limits.network_enabled = config_.allow_network;
    limits.stdout_cap_bytes = config_.stdout_cap_bytes;
    limits.stderr_cap_bytes = config_.stderr_cap_bytes;

    return limits;
}

void ResourceLimiter::ApplyTo(const EffectiveLimits& limits, utils::ProvisionSpec& spec) {
    spec.memory_limit_mb = limits.memory_limit_mb;
    spec.cpu_limit = limits.cpu_limit;
    spec.pids_limit = limits.pids_limit;
    spec.max_file_size_mb = limits.max_file_size_mb;
    spec.time_limit = limits.time_limit;
    spec.network_enabled = limits.network_enabled;
}

// ============================================================================
// WATCHDOG
// ============================================================================

Watchdog::Watchdog(std::chrono::milliseconds limit,
                   std::chrono::milliseconds grace,
                   Terminator terminator)
    : limit_(limit)
    , grace_(grace)
    , terminator_(std::move(terminator)) {
}

Watchdog::~Watchdog() {
    Disarm();
}

void Watchdog::Arm() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_) {
        return;
    }
    armed_ = true;
    deadline_ = std::chrono::steady_clock::now() + limit_;
    thread_ = std::thread(&Watchdog::Loop, this);
}

void Watchdog::Disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void Watchdog::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_requested_ = true;
    }
    cv_.notify_all();
}

TerminationReason Watchdog::Reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool Watchdog::Tripped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_ != TerminationReason::NONE;
}

bool Watchdog::HardStopReached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reason_ == TerminationReason::NONE) {
        return false;
    }
    return std::chrono::steady_clock::now() >= tripped_at_ + 2 * grace_;
}

void Watchdog::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    bool woken = cv_.wait_until(lock, deadline_, [this] {
        return stop_ || cancel_requested_;
    });

    if (woken && stop_) {
        return;
    }

    reason_ = woken ? TerminationReason::CANCELLED : TerminationReason::TIMEOUT;
    tripped_at_ = std::chrono::steady_clock::now();

    if (reason_ == TerminationReason::TIMEOUT) {
        spdlog::warn("Time limit reached ({} ms), terminating", limit_.count());
    } else {
        spdlog::info("Cancellation requested, terminating");
    }

    lock.unlock();
    terminator_(SIGTERM);
    lock.lock();

    if (cv_.wait_for(lock, grace_, [this] { return stop_; })) {
        return;
    }

    spdlog::warn("Payload survived SIGTERM for {} ms, sending SIGKILL", grace_.count());
    lock.unlock();
    terminator_(SIGKILL);
}

// ============================================================================
// CANCELLATION TOKEN
// ============================================================================

void CancellationToken::Cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    if (watchdog_) {
        watchdog_->Cancel();
    }
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationToken::Attach(Watchdog* watchdog) {
    std::lock_guard<std::mutex> lock(mutex_);
    watchdog_ = watchdog;
    if (cancelled_ && watchdog_) {
        watchdog_->Cancel();
    }
}

void CancellationToken::Detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    watchdog_ = nullptr;
}

std::string TerminationReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::NONE: return "none";
        case TerminationReason::TIMEOUT: return "timeout";
        case TerminationReason::CANCELLED: return "cancelled";
    }
    return "none";
}

} // namespace core
} // namespace timebox
