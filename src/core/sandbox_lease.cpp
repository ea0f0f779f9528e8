#include "timebox/core/sandbox_lease.hpp"
#include "timebox/core/sandbox_manager.hpp"

namespace timebox {
namespace core {

SandboxLease::SandboxLease(SandboxManager& manager, SandboxInstance& instance)
    : manager_(&manager)
    , instance_(&instance) {
}

SandboxLease::~SandboxLease() {
    Release();
}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : manager_(other.manager_)
    , instance_(other.instance_) {
    other.instance_ = nullptr;
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        Release();
        manager_ = other.manager_;
        instance_ = other.instance_;
        other.instance_ = nullptr;
    }
    return *this;
}

const std::string& SandboxLease::Id() const {
    return instance_->id;
}

const std::string& SandboxLease::EngineId() const {
    return instance_->engine_id;
}

const std::filesystem::path& SandboxLease::WorkingDirectory() const {
    return instance_->working_directory;
}

const ImageHandle& SandboxLease::Image() const {
    return *instance_->image;
}

const EffectiveLimits& SandboxLease::Limits() const {
    return instance_->limits;
}

SandboxState SandboxLease::State() const {
    return manager_->StateOf(*instance_);
}

void SandboxLease::Transition(SandboxState next) {
    manager_->Transition(*instance_, next);
}

void SandboxLease::Release() {
    if (instance_) {
        // Copy: the instance is freed inside Release()
        std::string id = instance_->id;
        instance_ = nullptr;
        manager_->Release(id);
    }
}

} // namespace core
} // namespace timebox
