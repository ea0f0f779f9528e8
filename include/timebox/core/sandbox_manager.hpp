/**
 * @file sandbox_manager.hpp
 * @brief Sandbox instance ownership and bounded admission
 *
 * The manager is the single owner of every live sandbox instance. It admits
 * at most `max_concurrency` of them at once (counting instances that are
 * still being torn down), provisions each from a pinned image into a fresh
 * private working directory, and reclaims them when their lease ends.
 *
 * **Instance Lifecycle**:
 * ```
 * CREATED → PROVISIONING → RUNNING → { COMPLETED | TIMED_OUT | CRASHED | KILLED } → RECLAIMED
 *              └──────────────────────────── (failure / cancel) ───────────────────────┘
 * ```
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/image_registry.hpp"
#include "timebox/core/resource_limiter.hpp"
#include "timebox/core/runner_config.hpp"
#include "timebox/core/sandbox_lease.hpp"
#include "timebox/utils/container_utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace timebox {
namespace core {

/**
 * @class AdmissionGate
 * @brief Counting gate with FIFO waiters and a bounded wait
 */
class AdmissionGate {
public:
    /**
     * @class Slot
     * @brief One admitted unit of capacity; returned on destruction
     */
    class Slot {
    public:
        Slot() = default;
        ~Slot() { Release(); }

        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                Release();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void Release();
        bool Held() const { return gate_ != nullptr; }

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_{nullptr};
    };

    explicit AdmissionGate(std::size_t ceiling);

    /**
     * @brief Wait up to @p wait for a free slot, first come first served
     * @throws AdmissionRejected when the wait elapses
     */
    Slot Acquire(std::chrono::milliseconds wait);

    std::size_t Ceiling() const { return ceiling_; }
    std::size_t InUse() const;
    std::size_t Waiting() const;

private:
    void ReleaseOne();

    const std::size_t ceiling_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_use_{0};
    std::deque<std::uint64_t> queue_;
    std::uint64_t next_ticket_{0};
};

/**
 * @enum SandboxState
 * @brief Lifecycle state of a sandbox instance
 */
enum class SandboxState {
    CREATED,
    PROVISIONING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    CRASHED,
    KILLED,
    RECLAIMED
};

/**
 * @struct SandboxInstance
 * @brief One isolated environment serving exactly one request
 */
struct SandboxInstance {
    std::string id;                                   ///< Manager-assigned id
    std::string engine_id;                            ///< Engine-assigned id (empty until provisioned)
    SandboxState state{SandboxState::CREATED};
    std::filesystem::path working_directory;          ///< Private, mode 0700
    const ImageHandle* image{nullptr};                ///< Pinned image (owned by the registry)
    EffectiveLimits limits;
    std::chrono::system_clock::time_point created_at;
    AdmissionGate::Slot slot;                         ///< Capacity held until reclaimed
};

/**
 * @class SandboxManager
 * @brief Creates, tracks and reclaims sandbox instances
 */
class SandboxManager {
public:
    SandboxManager(utils::ContainerEngine& engine,
                   ImageRegistry& registry,
                   const RunnerConfig& config);

    /// Reclaims anything still live
    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Admit and provision a fresh instance
     *
     * @throws InvalidRequestError if the runtime is unknown
     * @throws AdmissionRejected if no slot frees up within the admission wait
     * @throws InfrastructureFailure if provisioning fails (nothing leaks)
     */
    SandboxLease Acquire(const std::string& runtime,
                         const EffectiveLimits& limits,
                         const std::map<std::string, std::string>& environment);

    /**
     * @brief Destroy an instance's engine resource and working directory
     *
     * Idempotent. Teardown failures are logged, never thrown; the admission
     * slot is returned regardless.
     */
    void Release(std::string instance_id);

    /**
     * @brief Validated state change
     * @throws TimeboxError on an illegal transition
     */
    void Transition(SandboxInstance& instance, SandboxState next);

    SandboxState StateOf(SandboxInstance& instance) const;

    /// Instances not yet fully reclaimed
    std::size_t LiveCount() const;
    std::vector<std::string> LiveInstanceIds() const;

    const AdmissionGate& Gate() const { return gate_; }

    static bool IsValidTransition(SandboxState from, SandboxState to);

private:
    std::string GenerateInstanceId();
    std::filesystem::path CreateWorkingDirectory(const std::string& instance_id);

    utils::ContainerEngine& engine_;
    ImageRegistry& registry_;
    const RunnerConfig& config_;
    AdmissionGate gate_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<SandboxInstance>> instances_;
    std::atomic<std::uint64_t> counter_{0};
};

std::string SandboxStateToString(SandboxState state);

} // namespace core
} // namespace timebox
