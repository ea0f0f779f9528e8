/**
 * @file local_engine.hpp
 * @brief Host-process container engine for development and tests
 *
 * Runs the payload as a plain child process in its own process group with
 * kernel rlimits applied. The "image" is an interpreter name resolved on
 * PATH. Network isolation uses unprivileged user and network namespaces
 * when the kernel allows them.
 *
 * @date 2025
 */

#pragma once

#include "timebox/utils/container_utils.hpp"

#include <map>
#include <mutex>
#include <string>

namespace timebox {
namespace utils {

/**
 * @struct LocalEngineOptions
 */
struct LocalEngineOptions {
    bool strict_isolation{false};  ///< Refuse to run without a network namespace
};

/**
 * @class LocalProcessEngine
 * @brief ContainerEngine backed by fork/exec and setrlimit
 *
 * Weaker than DockerEngine: memory is bounded through RLIMIT_AS, there is no
 * filesystem isolation beyond the private working directory, and OOM
 * conditions surface as ordinary allocation failures inside the program.
 */
class LocalProcessEngine : public ContainerEngine {
public:
    explicit LocalProcessEngine(LocalEngineOptions options = LocalEngineOptions{});

    std::string Name() const override { return "local"; }

    /**
     * @brief Probe namespace support
     *
     * Always true unless strict isolation is requested and the kernel
     * refuses unprivileged network namespaces.
     */
    bool IsAvailable() override;

    /// Resolve the interpreter on PATH; the pinned id is its absolute path
    std::optional<ImageInfo> InspectImage(const std::string& tag) override;

    std::string Provision(const ProvisionSpec& spec) override;
    std::unique_ptr<Subprocess> Start(const std::string& engine_id) override;
    void Signal(const std::string& engine_id, Subprocess& client, int signal) override;
    EngineExitInfo Inspect(const std::string& engine_id) override;
    bool Destroy(const std::string& engine_id) override;
    bool StartsPayloadDirectly() const override { return true; }

    /// Whether payloads get a private network namespace
    bool NetworkIsolationSupported();

    /// Spawn options for a provisioned spec (exposed for tests)
    SpawnOptions BuildSpawnOptions(const ProvisionSpec& spec);

private:
    bool ProbeNamespaces() const;

    LocalEngineOptions options_;
    std::mutex mutex_;
    std::map<std::string, ProvisionSpec> provisioned_;
    std::optional<bool> namespaces_supported_;
};

} // namespace utils
} // namespace timebox
