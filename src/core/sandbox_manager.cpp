/**
 * @file sandbox_manager.cpp
 * @brief Implementation of sandbox admission, provisioning and reclamation
 *
 * **Provisioning Steps**:
 * 1. Admission: FIFO wait for a slot, bounded by the admission timeout
 * 2. Instance record with a unique id (never reused)
 * 3. Private working directory `<work_root>/<id>`, mode 0700
 * 4. Engine resource from the pinned image, limits applied
 *
 * A failure at any step unwinds the earlier ones before the error
 * propagates.
 *
 * @date 2025
 */

#include "timebox/core/sandbox_manager.hpp"
#include "timebox/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace timebox {
namespace core {

// ============================================================================
// ADMISSION GATE
// ============================================================================

AdmissionGate::AdmissionGate(std::size_t ceiling)
    : ceiling_(ceiling) {
}

AdmissionGate::Slot AdmissionGate::Acquire(std::chrono::milliseconds wait) {
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + wait;

    std::unique_lock<std::mutex> lock(mutex_);
    std::uint64_t ticket = next_ticket_++;
    queue_.push_back(ticket);

    bool admitted = cv_.wait_until(lock, deadline, [&] {
        return queue_.front() == ticket && in_use_ < ceiling_;
    });

    if (!admitted) {
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (*it == ticket) {
                queue_.erase(it);
                break;
            }
        }
        std::size_t in_use = in_use_;
        lock.unlock();
        // Our departure may have put someone else at the head
        cv_.notify_all();

        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        spdlog::warn("Admission rejected after {} ms ({} of {} slots in use)",
                     waited.count(), in_use, ceiling_);
        throw AdmissionRejected(ceiling_, waited);
    }

    queue_.pop_front();
    ++in_use_;
    lock.unlock();
    cv_.notify_all();

    return Slot(this);
}

std::size_t AdmissionGate::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

std::size_t AdmissionGate::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void AdmissionGate::ReleaseOne() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_all();
}

void AdmissionGate::Slot::Release() {
    if (gate_) {
        gate_->ReleaseOne();
        gate_ = nullptr;
    }
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

SandboxManager::SandboxManager(utils::ContainerEngine& engine,
                               ImageRegistry& registry,
                               const RunnerConfig& config)
    : engine_(engine)
    , registry_(registry)
    , config_(config)
    , gate_(config.max_concurrency) {
    spdlog::debug("Sandbox manager: ceiling {}, work root {}",
                  config_.max_concurrency, config_.work_root.string());
}

SandboxManager::~SandboxManager() {
    for (const auto& id : LiveInstanceIds()) {
        spdlog::warn("Reclaiming sandbox {} at shutdown", id);
        Release(id);
    }
}

// ============================================================================
// ACQUIRE / RELEASE
// ============================================================================

SandboxLease SandboxManager::Acquire(const std::string& runtime,
                                     const EffectiveLimits& limits,
                                     const std::map<std::string, std::string>& environment) {
    const ImageHandle& image = registry_.Get(runtime);

    AdmissionGate::Slot slot = gate_.Acquire(config_.admission_timeout);

    auto owned = std::make_unique<SandboxInstance>();
    owned->id = GenerateInstanceId();
    owned->image = &image;
    owned->limits = limits;
    owned->created_at = std::chrono::system_clock::now();
    owned->slot = std::move(slot);

    SandboxInstance& instance = *owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_[instance.id] = std::move(owned);
    }

    try {
        Transition(instance, SandboxState::PROVISIONING);

        instance.working_directory = CreateWorkingDirectory(instance.id);

        utils::ProvisionSpec spec;
        spec.name = instance.id;
        spec.image = image.pinned_id;
        spec.host_workdir = instance.working_directory;
        spec.command = ImageRegistry::ExpandCommand(image);
        spec.environment = environment;
        ResourceLimiter::ApplyTo(limits, spec);

        std::string engine_id = engine_.Provision(spec);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            instance.engine_id = engine_id;
        }
    } catch (const InfrastructureFailure&) {
        Release(instance.id);
        throw;
    } catch (const std::exception& e) {
        std::string id = instance.id;
        Release(id);
        throw InfrastructureFailure("Provisioning " + id + " failed: " + e.what());
    }

    spdlog::info("Sandbox {} provisioned ({} on {})", instance.id, image.runtime, engine_.Name());
    return SandboxLease(*this, instance);
}

void SandboxManager::Release(std::string instance_id) {
    SandboxInstance* instance = nullptr;
    std::string engine_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(instance_id);
        if (it == instances_.end() || it->second->state == SandboxState::RECLAIMED) {
            return;
        }
        instance = it->second.get();
        instance->state = SandboxState::RECLAIMED;
        engine_id = instance->engine_id;
    }

    if (!engine_id.empty() && !engine_.Destroy(engine_id)) {
        spdlog::error("Engine teardown failed for sandbox {}", instance_id);
    }

    if (!instance->working_directory.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(instance->working_directory, ec);
        if (ec) {
            spdlog::error("Cannot remove working directory {}: {}",
                          instance->working_directory.string(), ec.message());
        }
    }

    std::unique_ptr<SandboxInstance> reclaimed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(instance_id);
        if (it != instances_.end()) {
            reclaimed = std::move(it->second);
            instances_.erase(it);
        }
    }

    // Slot goes back last so teardown counts against the ceiling
    reclaimed.reset();
    spdlog::debug("Sandbox {} reclaimed", instance_id);
}

// ============================================================================
// STATE MACHINE
// ============================================================================

bool SandboxManager::IsValidTransition(SandboxState from, SandboxState to) {
    if (to == SandboxState::RECLAIMED) {
        return from != SandboxState::RECLAIMED;
    }

    switch (from) {
        case SandboxState::CREATED:
            return to == SandboxState::PROVISIONING;
        case SandboxState::PROVISIONING:
            return to == SandboxState::RUNNING || to == SandboxState::KILLED;
        case SandboxState::RUNNING:
            return to == SandboxState::COMPLETED || to == SandboxState::TIMED_OUT ||
                   to == SandboxState::CRASHED || to == SandboxState::KILLED;
        default:
            return false;
    }
}

void SandboxManager::Transition(SandboxInstance& instance, SandboxState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsValidTransition(instance.state, next)) {
        throw TimeboxError("Illegal sandbox transition " + SandboxStateToString(instance.state) +
                           " -> " + SandboxStateToString(next) + " for " + instance.id);
    }
    spdlog::debug("Sandbox {}: {} -> {}", instance.id,
                  SandboxStateToString(instance.state), SandboxStateToString(next));
    instance.state = next;
}

SandboxState SandboxManager::StateOf(SandboxInstance& instance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instance.state;
}

std::size_t SandboxManager::LiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

std::vector<std::string> SandboxManager::LiveInstanceIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(instances_.size());
    for (const auto& [id, instance] : instances_) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

std::string SandboxManager::GenerateInstanceId() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
    return "timebox_" + std::to_string(millis) + "_" + std::to_string(++counter_);
}

std::filesystem::path SandboxManager::CreateWorkingDirectory(const std::string& instance_id) {
    std::filesystem::create_directories(config_.work_root);

    auto workdir = config_.work_root / instance_id;
    if (!std::filesystem::create_directory(workdir)) {
        throw InfrastructureFailure("Working directory already exists: " + workdir.string());
    }
    std::filesystem::permissions(workdir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);
    return workdir;
}

std::string SandboxStateToString(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED: return "created";
        case SandboxState::PROVISIONING: return "provisioning";
        case SandboxState::RUNNING: return "running";
        case SandboxState::COMPLETED: return "completed";
        case SandboxState::TIMED_OUT: return "timed_out";
        case SandboxState::CRASHED: return "crashed";
        case SandboxState::KILLED: return "killed";
        case SandboxState::RECLAIMED: return "reclaimed";
    }
    return "unknown";
}

} // namespace core
} // namespace timebox
