/**
 * @file local_engine.cpp
 * @brief Implementation of the host-process container engine
 *
 * **Limits Applied in the Child**:
 * - RLIMIT_AS from the memory limit
 * - RLIMIT_CPU at ceil(time limit) + 1 s, a backstop behind the watchdog
 * - RLIMIT_FSIZE from the file size limit
 * - RLIMIT_CORE = 0
 * - CLONE_NEWUSER | CLONE_NEWNET when network access is not granted
 *
 * @date 2025
 */

#include "timebox/utils/local_engine.hpp"
#include "timebox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <sched.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace timebox {
namespace utils {

namespace {

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

LocalProcessEngine::LocalProcessEngine(LocalEngineOptions options)
    : options_(options) {
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool LocalProcessEngine::ProbeNamespaces() const {
    pid_t pid = fork();
    if (pid == -1) {
        spdlog::warn("Namespace probe: fork failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        _exit(unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0 ? 0 : 1);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return false;
        }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool LocalProcessEngine::NetworkIsolationSupported() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!namespaces_supported_) {
        namespaces_supported_ = ProbeNamespaces();
    }
    return *namespaces_supported_;
}

bool LocalProcessEngine::IsAvailable() {
    bool isolated = NetworkIsolationSupported();
    if (isolated) {
        spdlog::info("Local engine: payloads run without network access");
        return true;
    }

    if (options_.strict_isolation) {
        spdlog::error("Local engine: unprivileged network namespaces unavailable "
                      "and strict isolation is required");
        return false;
    }

    spdlog::warn("Local engine: network namespaces unavailable, payloads keep host network");
    return true;
}

std::optional<ImageInfo> LocalProcessEngine::InspectImage(const std::string& tag) {
    auto path = Which(tag);
    if (!path) {
        spdlog::error("Interpreter not found on PATH: {}", tag);
        return std::nullopt;
    }

    ImageInfo info;
    info.tag = tag;
    info.id = path->string();
    info.repo_tags = {tag};

    std::error_code ec;
    auto size = std::filesystem::file_size(*path, ec);
    if (!ec) {
        info.size_bytes = static_cast<std::size_t>(size);
    }
    return info;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::string LocalProcessEngine::Provision(const ProvisionSpec& spec) {
    if (spec.command.empty()) {
        throw core::InfrastructureFailure("Empty command for " + spec.name);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (provisioned_.count(spec.name)) {
        throw core::InfrastructureFailure("Duplicate sandbox name " + spec.name);
    }
    provisioned_[spec.name] = spec;

    spdlog::debug("Local sandbox provisioned: {}", spec.name);
    return spec.name;
}

SpawnOptions LocalProcessEngine::BuildSpawnOptions(const ProvisionSpec& spec) {
    SpawnOptions options;
    options.argv = spec.command;
    options.working_directory = spec.host_workdir;
    options.new_process_group = true;
    options.kill_group_on_exit = true;

    std::map<std::string, std::string> environment{
        {"PATH", kDefaultPath},
        {"HOME", spec.host_workdir.string()},
        {"LANG", "C.UTF-8"},
        {"TMPDIR", spec.host_workdir.string()}
    };
    for (const auto& [key, value] : spec.environment) {
        environment[key] = value;
    }
    options.environment = std::move(environment);

    ChildLimits& limits = options.limits;
    if (spec.memory_limit_mb > 0) {
        limits.address_space_bytes = spec.memory_limit_mb * 1024 * 1024;
    }
    if (spec.time_limit.count() > 0) {
        auto whole_seconds = (spec.time_limit.count() + 999) / 1000;
        limits.cpu_seconds = static_cast<std::size_t>(whole_seconds) + 1;
    }
    if (spec.max_file_size_mb > 0) {
        limits.file_size_bytes = spec.max_file_size_mb * 1024 * 1024;
    }
    limits.disable_core_dumps = true;

    if (!spec.network_enabled) {
        limits.isolate_network = NetworkIsolationSupported() || options_.strict_isolation;
        limits.require_network_isolation = options_.strict_isolation;
    }

    return options;
}

std::unique_ptr<Subprocess> LocalProcessEngine::Start(const std::string& engine_id) {
    ProvisionSpec spec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = provisioned_.find(engine_id);
        if (it == provisioned_.end()) {
            throw core::InfrastructureFailure("Unknown local sandbox " + engine_id);
        }
        spec = it->second;
    }

    try {
        return Subprocess::Spawn(BuildSpawnOptions(spec));
    } catch (const std::system_error& e) {
        throw core::InfrastructureFailure("Cannot start " + engine_id + ": " + e.what());
    }
}

void LocalProcessEngine::Signal(const std::string& engine_id, Subprocess& client, int signal) {
    if (!client.SignalGroup(signal)) {
        spdlog::debug("Signal {} to {} not delivered (already exited)", signal, engine_id);
    }
}

EngineExitInfo LocalProcessEngine::Inspect(const std::string&) {
    // Everything the host knows comes from the wait status
    return EngineExitInfo{};
}

bool LocalProcessEngine::Destroy(const std::string& engine_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    provisioned_.erase(engine_id);
    return true;
}

} // namespace utils
} // namespace timebox
