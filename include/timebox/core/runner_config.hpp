/**
 * @file runner_config.hpp
 * @brief Administrative configuration of the execution core
 *
 * Holds the concurrency ceiling, default and maximum limits, capture caps,
 * engine selection and the runtime profiles that map a logical interpreter
 * name to a container image. Loaded from JSON, overridable from the CLI.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace timebox {
namespace core {

/**
 * @enum EngineKind
 * @brief Which isolation mechanism provisions sandboxes
 */
enum class EngineKind {
    DOCKER,         ///< One container per request via the docker CLI
    LOCAL_PROCESS   ///< Host process with rlimits and namespaces (development)
};

/**
 * @struct RuntimeProfile
 * @brief How one logical runtime is started
 *
 * Command placeholders: `{file}` is the entry file name inside the working
 * directory, `{image}` the pinned image reference (for the local engine, the
 * resolved interpreter path).
 */
struct RuntimeProfile {
    std::string image;                 ///< Image tag (docker) or interpreter (local)
    std::vector<std::string> command;  ///< argv template
    std::string entry_file;            ///< Payload file name
};

/**
 * @struct RunnerConfig
 * @brief Complete runner configuration
 */
struct RunnerConfig {
    // Engine
    EngineKind engine{EngineKind::DOCKER};                        ///< Isolation mechanism
    std::string docker_binary{"docker"};                          ///< docker CLI to invoke
    std::string docker_user;                                      ///< --user (empty = host uid:gid)
    std::chrono::milliseconds engine_command_timeout{30000};      ///< Bound on each engine CLI call
    bool measure_with_time{true};                                 ///< Wrap payload with GNU time -v
    bool strict_isolation{false};                                 ///< Local: fail if no network namespace

    // Admission
    std::size_t max_concurrency{4};                               ///< Live sandbox ceiling
    std::chrono::milliseconds admission_timeout{2000};            ///< Max wait for a free slot

    // Limits
    std::chrono::milliseconds default_time_limit{10000};          ///< When the request has none
    std::chrono::milliseconds max_time_limit{60000};              ///< Upper bound on requests
    std::chrono::milliseconds termination_grace{500};             ///< SIGTERM → SIGKILL window
    std::size_t default_memory_limit_mb{128};                     ///< When the request has none
    std::size_t max_memory_limit_mb{2048};                        ///< Upper bound on requests
    double default_cpu_limit{0.5};                                ///< CPU cores
    int pids_limit{64};                                           ///< Process count ceiling
    std::size_t max_file_size_mb{16};                             ///< Largest file the program may write
    bool allow_network{false};                                    ///< Grant network access

    // Capture
    std::size_t stdout_cap_bytes{64 * 1024};                      ///< Per-stream byte cap
    std::size_t stderr_cap_bytes{64 * 1024};                      ///< Per-stream byte cap

    // Layout
    std::filesystem::path work_root;                              ///< Parent of instance directories
    std::string default_runtime{"python"};                        ///< Profile for requests without one
    std::map<std::string, RuntimeProfile> runtimes;               ///< Logical runtime → profile
};

/**
 * @brief Default configuration for an engine
 *
 * Docker gets the `python-with-time` image; the local engine gets `python3`
 * and `sh` from PATH.
 */
RunnerConfig DefaultRunnerConfig(EngineKind engine = EngineKind::DOCKER);

/**
 * @brief Default runtime profiles for an engine
 */
std::map<std::string, RuntimeProfile> DefaultRuntimeProfiles(EngineKind engine);

/**
 * @brief Parse a JSON configuration document
 *
 * Keys are camelCase versions of the RunnerConfig fields; durations are in
 * milliseconds with an `Ms` suffix. Missing keys keep their defaults; when
 * `runtimes` is missing the engine's default profiles are used.
 *
 * @throws TimeboxError on malformed JSON or wrongly typed values
 */
RunnerConfig ParseRunnerConfig(const std::string& json_text);

/**
 * @brief Load and parse a JSON configuration file
 * @throws TimeboxError if the file cannot be read or parsed
 */
RunnerConfig LoadRunnerConfig(const std::filesystem::path& path);

/**
 * @brief Serialize a configuration back to JSON (for `check` output)
 */
std::string RunnerConfigToJson(const RunnerConfig& config, int indent = 2);

/**
 * @brief List everything wrong with a configuration
 * @return Human readable problems; empty when the configuration is usable
 */
std::vector<std::string> CheckConfigIssues(const RunnerConfig& config);

/// "docker" / "local"
std::string EngineKindToString(EngineKind engine);

/// Inverse of EngineKindToString; throws TimeboxError on unknown names
EngineKind ParseEngineKind(const std::string& name);

/**
 * @class RunnerConfigBuilder
 * @brief Fluent API for constructing runner configurations
 *
 * **Usage Example**:
 * @code
 * auto config = RunnerConfigBuilder(EngineKind::LOCAL_PROCESS)
 *     .WithMaxConcurrency(2)
 *     .WithDefaultTimeLimit(std::chrono::seconds(5))
 *     .WithCaptureCaps(4096, 4096)
 *     .Build();
 * @endcode
 */
class RunnerConfigBuilder {
public:
    explicit RunnerConfigBuilder(EngineKind engine = EngineKind::DOCKER)
        : config_(DefaultRunnerConfig(engine)) {}

    RunnerConfigBuilder& WithMaxConcurrency(std::size_t ceiling) {
        config_.max_concurrency = ceiling;
        return *this;
    }

    RunnerConfigBuilder& WithAdmissionTimeout(std::chrono::milliseconds timeout) {
        config_.admission_timeout = timeout;
        return *this;
    }

    RunnerConfigBuilder& WithDefaultTimeLimit(std::chrono::milliseconds limit) {
        config_.default_time_limit = limit;
        return *this;
    }

    RunnerConfigBuilder& WithTerminationGrace(std::chrono::milliseconds grace) {
        config_.termination_grace = grace;
        return *this;
    }

    RunnerConfigBuilder& WithDefaultMemoryLimit(std::size_t mb) {
        config_.default_memory_limit_mb = mb;
        return *this;
    }

    RunnerConfigBuilder& WithCaptureCaps(std::size_t stdout_bytes, std::size_t stderr_bytes) {
        config_.stdout_cap_bytes = stdout_bytes;
        config_.stderr_cap_bytes = stderr_bytes;
        return *this;
    }

    RunnerConfigBuilder& WithNetwork(bool allow) {
        config_.allow_network = allow;
        return *this;
    }

    RunnerConfigBuilder& WithWorkRoot(const std::filesystem::path& root) {
        config_.work_root = root;
        return *this;
    }

    RunnerConfigBuilder& WithRuntime(const std::string& name, const RuntimeProfile& profile) {
        config_.runtimes[name] = profile;
        return *this;
    }

    RunnerConfigBuilder& WithDefaultRuntime(const std::string& name) {
        config_.default_runtime = name;
        return *this;
    }

    RunnerConfig Build() const {
        return config_;
    }

private:
    RunnerConfig config_;
};

} // namespace core
} // namespace timebox
