/**
 * @file container_utils.hpp
 * @brief Container engine abstraction and the Docker CLI implementation
 *
 * A ContainerEngine is the connection to whatever provides isolation. It
 * resolves images, provisions one resource per sandbox instance, starts the
 * payload with its standard streams attached to pipes, delivers termination
 * signals, reports engine-side exit facts (OOM kills, peak memory) and tears
 * the resource down again.
 *
 * @date 2025
 */

#pragma once

#include "timebox/utils/process_utils.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace timebox {
namespace utils {

/**
 * @enum ContainerState
 * @brief Engine-reported container lifecycle states
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    REMOVING,  ///< Removal in progress
    UNKNOWN    ///< Unknown state
};

/**
 * @struct ImageInfo
 * @brief A resolved, pinned image
 */
struct ImageInfo {
    std::string id;                       ///< Content id (sha256:...) or interpreter path
    std::string tag;                      ///< Tag that was resolved
    std::vector<std::string> repo_tags;   ///< All tags pointing at the id
    std::string created;                  ///< Engine creation timestamp
    std::size_t size_bytes{0};            ///< Image size
};

/**
 * @struct ProvisionSpec
 * @brief Everything an engine needs to create one sandbox resource
 */
struct ProvisionSpec {
    std::string name;                                 ///< Unique instance name
    std::string image;                                ///< Pinned image id
    std::filesystem::path host_workdir;               ///< Private working directory
    std::vector<std::string> command;                 ///< Expanded argv
    std::map<std::string, std::string> environment;   ///< Environment for the payload
    std::size_t memory_limit_mb{0};                   ///< 0 = unlimited
    double cpu_limit{0.0};                            ///< 0 = unlimited
    int pids_limit{0};                                ///< 0 = unlimited
    std::size_t max_file_size_mb{0};                  ///< 0 = unlimited
    std::chrono::milliseconds time_limit{0};          ///< Wall-clock limit (CPU backstop)
    bool network_enabled{false};                      ///< Grant network access
};

/**
 * @struct EngineExitInfo
 * @brief Exit facts only the engine knows
 */
struct EngineExitInfo {
    std::optional<int> exit_code;              ///< Authoritative exit code, if any
    bool oom_killed{false};                    ///< Killed by the memory cgroup
    std::optional<std::size_t> max_memory_kb;  ///< Peak resident set
    bool payload_started{true};                ///< false: the engine never ran the payload
    std::optional<std::string> engine_error;   ///< Engine-side failure, or why it could not report
};

/**
 * @class ContainerEngine
 * @brief Abstract connection to an isolation engine
 *
 * Implementations must be safe to call from several threads at once, each
 * thread working on a different engine id.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /// Short engine name for logs ("docker", "local")
    virtual std::string Name() const = 0;

    /// Engine reachable and usable
    virtual bool IsAvailable() = 0;

    /**
     * @brief Resolve a tag to a pinned image
     * @return nullopt if the image does not exist
     * @throws core::InfrastructureFailure if the engine cannot be queried
     */
    virtual std::optional<ImageInfo> InspectImage(const std::string& tag) = 0;

    /**
     * @brief Create the sandbox resource (not started)
     * @return Engine-assigned id
     * @throws core::InfrastructureFailure on failure
     */
    virtual std::string Provision(const ProvisionSpec& spec) = 0;

    /**
     * @brief Start the provisioned payload with piped standard streams
     * @throws core::InfrastructureFailure if it cannot be started
     */
    virtual std::unique_ptr<Subprocess> Start(const std::string& engine_id) = 0;

    /**
     * @brief Deliver a termination signal to everything in the sandbox
     * @param client The process returned by Start()
     */
    virtual void Signal(const std::string& engine_id, Subprocess& client, int signal) = 0;

    /**
     * @brief Engine-side exit facts, queried after the payload ended
     *
     * A failed query is reported through EngineExitInfo::engine_error, not
     * thrown.
     */
    virtual EngineExitInfo Inspect(const std::string& engine_id) = 0;

    /// The process returned by Start() is the payload itself, not a client
    virtual bool StartsPayloadDirectly() const { return false; }

    /**
     * @brief Forcibly stop and remove the sandbox resource
     * @return false if removal failed (already logged); idempotent
     */
    virtual bool Destroy(const std::string& engine_id) = 0;
};

/**
 * @struct DockerEngineOptions
 * @brief Docker CLI settings
 */
struct DockerEngineOptions {
    std::string binary{"docker"};                       ///< docker executable
    std::string user;                                   ///< --user value (empty = host uid:gid)
    std::chrono::milliseconds command_timeout{30000};   ///< Bound on each CLI call
    bool measure_with_time{true};                       ///< Wrap payload in GNU time -v
};

/**
 * @class DockerEngine
 * @brief One hardened container per sandbox, driven through the docker CLI
 *
 * **Container Hardening**:
 * - `--network none` unless network is requested
 * - `--memory` with equal `--memory-swap`, `--cpus`, `--pids-limit`
 * - `--cap-drop ALL`, `--security-opt no-new-privileges`
 * - `--init` so signals reach the interpreter even though it is not PID 1
 * - working directory bind-mounted at `/sandbox`, owned by the host user
 *
 * **Usage Example**:
 * @code
 * DockerEngine engine;
 * auto image = engine.InspectImage("python-with-time");
 * ProvisionSpec spec;
 * spec.name = "timebox_1";
 * spec.image = image->id;
 * spec.command = {"python", "client_script.py"};
 * auto id = engine.Provision(spec);
 * auto client = engine.Start(id);
 * @endcode
 */
class DockerEngine : public ContainerEngine {
public:
    explicit DockerEngine(DockerEngineOptions options = DockerEngineOptions{});
    ~DockerEngine() override;

    DockerEngine(const DockerEngine&) = delete;
    DockerEngine& operator=(const DockerEngine&) = delete;

    std::string Name() const override { return "docker"; }
    bool IsAvailable() override;
    std::optional<ImageInfo> InspectImage(const std::string& tag) override;
    std::string Provision(const ProvisionSpec& spec) override;
    std::unique_ptr<Subprocess> Start(const std::string& engine_id) override;
    void Signal(const std::string& engine_id, Subprocess& client, int signal) override;
    EngineExitInfo Inspect(const std::string& engine_id) override;
    bool Destroy(const std::string& engine_id) override;

    /// Arguments for `docker create` (without the binary)
    std::vector<std::string> BuildCreateArgs(const ProvisionSpec& spec) const;

    /// Exit facts from `docker inspect <container>` output
    static EngineExitInfo ParseInspectOutput(const std::string& json_str);

    /// Image facts from `docker image inspect <tag>` output
    static std::optional<ImageInfo> ParseImageInspectOutput(const std::string& json_str,
                                                            const std::string& tag);

    /// Peak RSS from GNU `time -v` output
    static std::optional<std::size_t> ParseTimeStats(const std::string& stats);

    static ContainerState ParseState(const std::string& state_str);

    /// In-container path of the GNU time statistics file
    static constexpr const char* kTimeStatsPath = "/tmp/.timebox_time_stats";

private:
    struct TrackedContainer {
        std::string name;
        std::filesystem::path host_workdir;
        std::chrono::system_clock::time_point created_at;
    };

    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    bool CopyFromContainer(const std::string& container_id,
                           const std::string& source,
                           const std::filesystem::path& dest) const;
    std::string ResolveUser() const;

    DockerEngineOptions options_;
    mutable std::mutex tracked_mutex_;
    std::map<std::string, TrackedContainer> tracked_containers_;
};

} // namespace utils
} // namespace timebox
