/**
 * @file container_utils.cpp
 * @brief Implementation of the Docker CLI container engine
 *
 * Every docker invocation goes through RunCommand() with an explicit argv
 * (no shell) and a timeout, so a hung daemon surfaces as an
 * InfrastructureFailure instead of a stuck request.
 *
 * **Docker Operations Used**:
 * - `docker info` / `docker --version`: availability
 * - `docker image inspect`: tag → pinned content id
 * - `docker create`: hardened container with limits and bind mount
 * - `docker start -a -i`: run attached, streams piped to us
 * - `docker kill --signal`: watchdog termination
 * - `docker inspect`: exit code and OOM flag
 * - `docker cp`: GNU time statistics out of the stopped container
 * - `docker rm --force`: teardown
 *
 * @date 2025
 */

#include "timebox/utils/container_utils.hpp"
#include "timebox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <signal.h>
#include <unistd.h>

#include <fstream>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace timebox {
namespace utils {

namespace {

std::string TrimTrailing(std::string text) {
    text.erase(text.find_last_not_of(" \n\r\t") + 1);
    return text;
}

bool LooksLikeMissingObject(const std::string& error) {
    return error.find("No such image") != std::string::npos ||
           error.find("No such object") != std::string::npos ||
           error.find("No such container") != std::string::npos ||
           error.find("not found") != std::string::npos;
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerEngine::DockerEngine(DockerEngineOptions options)
    : options_(std::move(options)) {
    spdlog::debug("Docker engine using binary: {}", options_.binary);
}

DockerEngine::~DockerEngine() {
    std::map<std::string, TrackedContainer> leftovers;
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        leftovers.swap(tracked_containers_);
    }

    for (const auto& [id, info] : leftovers) {
        spdlog::warn("Removing leftover container {} ({})", info.name, id.substr(0, 12));
        ExecuteDockerCommand({"rm", "--force", id});
    }
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerEngine::IsAvailable() {
    auto result = ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"});
    if (result.exit_code != 0) {
        spdlog::error("Docker daemon not reachable: {}",
                      TrimTrailing(result.error.empty() ? result.output : result.error));
        return false;
    }
    spdlog::info("Docker daemon version: {}", TrimTrailing(result.output));
    return true;
}

// ============================================================================
// IMAGE RESOLUTION
// ============================================================================

std::optional<ImageInfo> DockerEngine::InspectImage(const std::string& tag) {
    auto result = ExecuteDockerCommand({"image", "inspect", tag});

    if (result.exit_code == 0) {
        try {
            return ParseImageInspectOutput(result.output, tag);
        } catch (const std::exception& e) {
            throw core::InfrastructureFailure("Unreadable image inspect output for " + tag +
                                              ": " + e.what());
        }
    }

    if (!result.spawn_failed && !result.timed_out && LooksLikeMissingObject(result.error)) {
        spdlog::error("Image not found: {}", tag);
        return std::nullopt;
    }

    throw core::InfrastructureFailure("Cannot query docker for image " + tag + ": " +
                                      TrimTrailing(result.error));
}

std::optional<ImageInfo> DockerEngine::ParseImageInspectOutput(const std::string& json_str,
                                                               const std::string& tag) {
    json j = json::parse(json_str);

    // docker image inspect returns an array with one object per argument
    if (j.is_array()) {
        if (j.empty()) {
            return std::nullopt;
        }
        j = j[0];
    }

    ImageInfo info;
    info.tag = tag;
    info.id = j.value("Id", "");
    info.created = j.value("Created", "");
    info.size_bytes = j.value("Size", static_cast<std::size_t>(0));
    if (j.contains("RepoTags") && j["RepoTags"].is_array()) {
        info.repo_tags = j["RepoTags"].get<std::vector<std::string>>();
    }

    if (info.id.empty()) {
        return std::nullopt;
    }
    return info;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string DockerEngine::ResolveUser() const {
    if (!options_.user.empty()) {
        return options_.user;
    }
    // Match the host user so the bind-mounted directory stays removable
    return std::to_string(getuid()) + ":" + std::to_string(getgid());
}

std::vector<std::string> DockerEngine::BuildCreateArgs(const ProvisionSpec& spec) const {
    std::vector<std::string> args;

    args.push_back("create");
    args.push_back("--name");
    args.push_back(spec.name);
    args.push_back("--interactive");
    args.push_back("--init");

    args.push_back("--network");
    args.push_back(spec.network_enabled ? "bridge" : "none");

    if (spec.memory_limit_mb > 0) {
        std::string memory = std::to_string(spec.memory_limit_mb) + "m";
        args.push_back("--memory");
        args.push_back(memory);
        args.push_back("--memory-swap");
        args.push_back(memory);
    }

    if (spec.cpu_limit > 0.0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(spec.cpu_limit));
    }

    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.pids_limit));
    }

    if (spec.max_file_size_mb > 0) {
        std::string bytes = std::to_string(spec.max_file_size_mb * 1024 * 1024);
        args.push_back("--ulimit");
        args.push_back("fsize=" + bytes + ":" + bytes);
    }

    // Security: no capabilities, no privilege escalation
    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    args.push_back("--user");
    args.push_back(ResolveUser());

    args.push_back("--volume");
    args.push_back(std::filesystem::absolute(spec.host_workdir).string() + ":/sandbox");
    args.push_back("--workdir");
    args.push_back("/sandbox");

    for (const auto& [key, value] : spec.environment) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }

    // Image (must be last before command)
    args.push_back(spec.image);

    if (options_.measure_with_time) {
        args.push_back("/usr/bin/time");
        args.push_back("-v");
        args.push_back("-o");
        args.push_back(kTimeStatsPath);
    }
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::string DockerEngine::Provision(const ProvisionSpec& spec) {
    spdlog::info("Creating container: {}", spec.name);

    auto result = ExecuteDockerCommand(BuildCreateArgs(spec));
    if (result.exit_code != 0) {
        spdlog::error("Failed to create container: {}", TrimTrailing(result.error));
        throw core::InfrastructureFailure("docker create failed for " + spec.name + ": " +
                                          TrimTrailing(result.error));
    }

    std::string container_id = TrimTrailing(result.output);
    if (container_id.empty()) {
        throw core::InfrastructureFailure("docker create returned no container id");
    }

    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        tracked_containers_[container_id] = TrackedContainer{
            spec.name, spec.host_workdir, std::chrono::system_clock::now()};
    }

    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::unique_ptr<Subprocess> DockerEngine::Start(const std::string& engine_id) {
    SpawnOptions options;
    options.argv = {options_.binary, "start", "--attach", "--interactive", engine_id};
    options.limits.disable_core_dumps = false;

    try {
        return Subprocess::Spawn(options);
    } catch (const std::system_error& e) {
        throw core::InfrastructureFailure("Cannot start container " + engine_id.substr(0, 12) +
                                          ": " + e.what());
    }
}

void DockerEngine::Signal(const std::string& engine_id, Subprocess& client, int signal) {
    spdlog::info("Sending signal {} to container {}", signal, engine_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"kill", "--signal", std::to_string(signal), engine_id});
    if (result.exit_code != 0) {
        // Usually the container already exited
        spdlog::debug("docker kill: {}", TrimTrailing(result.error));
    }

    if (signal == SIGKILL) {
        // The attached client can outlive a wedged daemon; never wait on it
        client.SignalGroup(SIGKILL);
    }
}

EngineExitInfo DockerEngine::Inspect(const std::string& engine_id) {
    EngineExitInfo info;

    auto result = ExecuteDockerCommand({"inspect", engine_id});
    if (result.exit_code != 0) {
        spdlog::warn("docker inspect failed for {}: {}", engine_id.substr(0, 12),
                     TrimTrailing(result.error));
        info.engine_error = "docker inspect failed: " + TrimTrailing(result.error);
        return info;
    }

    try {
        info = ParseInspectOutput(result.output);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse inspect output: {}", e.what());
        info.engine_error = std::string("Unreadable docker inspect output: ") + e.what();
        return info;
    }

    if (!info.payload_started || !options_.measure_with_time) {
        return info;
    }

    std::filesystem::path workdir;
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        auto it = tracked_containers_.find(engine_id);
        if (it != tracked_containers_.end()) {
            workdir = it->second.host_workdir;
        }
    }
    if (workdir.empty()) {
        return info;
    }

    auto stats_file = workdir / ".timebox_time_stats";
    if (CopyFromContainer(engine_id, kTimeStatsPath, stats_file)) {
        std::ifstream file(stats_file);
        std::ostringstream content;
        content << file.rdbuf();
        info.max_memory_kb = ParseTimeStats(content.str());

        std::error_code ec;
        std::filesystem::remove(stats_file, ec);
    }

    return info;
}

bool DockerEngine::Destroy(const std::string& engine_id) {
    spdlog::info("Removing container: {}", engine_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"rm", "--force", "--volumes", engine_id});

    bool removed = result.exit_code == 0 ||
                   (!result.spawn_failed && !result.timed_out &&
                    result.error.find("No such container") != std::string::npos);

    if (removed) {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        tracked_containers_.erase(engine_id);
        return true;
    }

    spdlog::error("Failed to remove container {}: {}", engine_id.substr(0, 12),
                  TrimTrailing(result.error));
    return false;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

bool DockerEngine::CopyFromContainer(const std::string& container_id,
                                     const std::string& source,
                                     const std::filesystem::path& dest) const {
    auto result = ExecuteDockerCommand({"cp", container_id + ":" + source, dest.string()});

    if (result.exit_code == 0) {
        return true;
    }

    spdlog::debug("Failed to copy {} out of {}: {}", source, container_id.substr(0, 12),
                  TrimTrailing(result.error));
    return false;
}

// ============================================================================
// PARSING
// ============================================================================

EngineExitInfo DockerEngine::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array() && !j.empty()) {
        j = j[0];
    }

    EngineExitInfo info;
    if (j.contains("State") && j["State"].is_object()) {
        const auto& state = j["State"];
        if (state.contains("ExitCode") && state["ExitCode"].is_number_integer()) {
            info.exit_code = state["ExitCode"].get<int>();
        }
        info.oom_killed = state.value("OOMKilled", false);

        ContainerState status = ParseState(state.value("Status", ""));
        if (status == ContainerState::RUNNING) {
            // Still running means the exit code is meaningless
            info.exit_code.reset();
        }

        // StartedAt stays at the zero time until a start succeeds
        std::string started_at = state.value("StartedAt", "");
        if (status == ContainerState::CREATED || started_at.rfind("0001-01-01", 0) == 0) {
            info.payload_started = false;
            info.exit_code.reset();
        }

        std::string error = state.value("Error", "");
        if (!error.empty()) {
            info.engine_error = error;
        }
    }

    return info;
}

std::optional<std::size_t> DockerEngine::ParseTimeStats(const std::string& stats) {
    static const std::regex rss_regex(R"(Maximum resident set size \(kbytes\):\s*(\d+))");

    std::smatch match;
    if (std::regex_search(stats, match, rss_regex)) {
        try {
            return static_cast<std::size_t>(std::stoull(match[1].str()));
        } catch (const std::exception& e) {
            spdlog::debug("Unparseable resident set size: {}", e.what());
        }
    }
    return std::nullopt;
}

ContainerState DockerEngine::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::REMOVING;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

CommandResult DockerEngine::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.binary);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {} {}", options_.binary, args.empty() ? "" : args.front());

    return RunCommand(argv, options_.command_timeout);
}

} // namespace utils
} // namespace timebox
