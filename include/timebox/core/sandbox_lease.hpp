/**
 * @file sandbox_lease.hpp
 * @brief Scoped ownership of one sandbox instance for one request
 *
 * A lease is the only way the execution path touches a sandbox. Destroying
 * the lease (normal return, exception, early exit) releases the instance, so
 * teardown happens exactly once on every path.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace timebox {
namespace core {

class SandboxManager;
struct SandboxInstance;
struct ImageHandle;
struct EffectiveLimits;
enum class SandboxState;

/**
 * @class SandboxLease
 * @brief Move-only handle that releases its instance on destruction
 */
class SandboxLease {
public:
    SandboxLease(SandboxManager& manager, SandboxInstance& instance);
    ~SandboxLease();

    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;
    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    const std::string& Id() const;
    const std::string& EngineId() const;
    const std::filesystem::path& WorkingDirectory() const;
    const ImageHandle& Image() const;
    const EffectiveLimits& Limits() const;
    SandboxState State() const;

    /**
     * @brief Move the instance to its next lifecycle state
     * @throws TimeboxError on an illegal transition
     */
    void Transition(SandboxState next);

    /// Release early; the destructor then does nothing
    void Release();

    bool Active() const { return instance_ != nullptr; }

private:
    SandboxManager* manager_;
    SandboxInstance* instance_;
};

} // namespace core
} // namespace timebox
