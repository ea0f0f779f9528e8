/**
 * @file runner_config.cpp
 * @brief Runner configuration defaults, JSON loading and validation
 *
 * **Example Configuration**:
 * ```json
 * {
 *   "engine": "docker",
 *   "maxConcurrency": 4,
 *   "admissionTimeoutMs": 2000,
 *   "defaultTimeLimitMs": 10000,
 *   "defaultMemoryLimitMb": 128,
 *   "stdoutCapBytes": 65536,
 *   "runtimes": {
 *     "python": {
 *       "image": "python-with-time",
 *       "command": ["python", "{file}"],
 *       "entryFile": "client_script.py"
 *     }
 *   }
 * }
 * ```
 *
 * @date 2025
 */

#include "timebox/core/runner_config.hpp"
#include "timebox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace timebox {
namespace core {

namespace {

std::filesystem::path DefaultWorkRoot() {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "timebox";
}

template <typename T>
void ReadValue(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = std::chrono::milliseconds(j[key].get<long long>());
    }
}

RuntimeProfile ParseProfile(const json& j) {
    RuntimeProfile profile;
    profile.image = j.at("image").get<std::string>();
    profile.command = j.at("command").get<std::vector<std::string>>();
    profile.entry_file = j.value("entryFile", std::string("main"));
    return profile;
}

} // anonymous namespace

// ============================================================================
// DEFAULTS
// ============================================================================

std::map<std::string, RuntimeProfile> DefaultRuntimeProfiles(EngineKind engine) {
    std::map<std::string, RuntimeProfile> profiles;

    switch (engine) {
        case EngineKind::DOCKER:
            profiles["python"] = RuntimeProfile{
                "python-with-time", {"python", "{file}"}, "client_script.py"};
            break;
        case EngineKind::LOCAL_PROCESS:
            profiles["python"] = RuntimeProfile{
                "python3", {"{image}", "{file}"}, "client_script.py"};
            profiles["sh"] = RuntimeProfile{"sh", {"{image}", "{file}"}, "main.sh"};
            break;
    }

    return profiles;
}

RunnerConfig DefaultRunnerConfig(EngineKind engine) {
    RunnerConfig config;
    config.engine = engine;
    config.work_root = DefaultWorkRoot();
    config.runtimes = DefaultRuntimeProfiles(engine);
    if (engine == EngineKind::LOCAL_PROCESS) {
        // GNU time is a property of the docker image
        config.measure_with_time = false;
    }
    return config;
}

std::string EngineKindToString(EngineKind engine) {
    switch (engine) {
        case EngineKind::DOCKER: return "docker";
        case EngineKind::LOCAL_PROCESS: return "local";
    }
    return "docker";
}

EngineKind ParseEngineKind(const std::string& name) {
    if (name == "docker") return EngineKind::DOCKER;
    if (name == "local") return EngineKind::LOCAL_PROCESS;
    throw TimeboxError("Unknown engine '" + name + "' (expected docker or local)");
}

// ============================================================================
// JSON LOADING
// ============================================================================

RunnerConfig ParseRunnerConfig(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw TimeboxError(std::string("Malformed configuration JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw TimeboxError("Configuration must be a JSON object");
    }

    try {
        EngineKind engine = ParseEngineKind(j.value("engine", std::string("docker")));
        RunnerConfig config = DefaultRunnerConfig(engine);

        ReadValue(j, "dockerBinary", config.docker_binary);
        ReadValue(j, "dockerUser", config.docker_user);
        ReadMillis(j, "engineCommandTimeoutMs", config.engine_command_timeout);
        ReadValue(j, "measureWithTime", config.measure_with_time);
        ReadValue(j, "strictIsolation", config.strict_isolation);

        ReadValue(j, "maxConcurrency", config.max_concurrency);
        ReadMillis(j, "admissionTimeoutMs", config.admission_timeout);

        ReadMillis(j, "defaultTimeLimitMs", config.default_time_limit);
        ReadMillis(j, "maxTimeLimitMs", config.max_time_limit);
        ReadMillis(j, "terminationGraceMs", config.termination_grace);
        ReadValue(j, "defaultMemoryLimitMb", config.default_memory_limit_mb);
        ReadValue(j, "maxMemoryLimitMb", config.max_memory_limit_mb);
        ReadValue(j, "defaultCpuLimit", config.default_cpu_limit);
        ReadValue(j, "pidsLimit", config.pids_limit);
        ReadValue(j, "maxFileSizeMb", config.max_file_size_mb);
        ReadValue(j, "allowNetwork", config.allow_network);

        ReadValue(j, "stdoutCapBytes", config.stdout_cap_bytes);
        ReadValue(j, "stderrCapBytes", config.stderr_cap_bytes);

        if (j.contains("workRoot")) {
            config.work_root = j["workRoot"].get<std::string>();
        }
        ReadValue(j, "defaultRuntime", config.default_runtime);

        if (j.contains("runtimes")) {
            config.runtimes.clear();
            for (const auto& [name, profile] : j["runtimes"].items()) {
                config.runtimes[name] = ParseProfile(profile);
            }
        }

        return config;
    } catch (const json::exception& e) {
        throw TimeboxError(std::string("Invalid configuration value: ") + e.what());
    }
}

RunnerConfig LoadRunnerConfig(const std::filesystem::path& path) {
    spdlog::info("Loading configuration: {}", path.string());

    std::ifstream file(path);
    if (!file.is_open()) {
        throw TimeboxError("Cannot open configuration file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    return ParseRunnerConfig(content.str());
}

std::string RunnerConfigToJson(const RunnerConfig& config, int indent) {
    json j;
    j["engine"] = EngineKindToString(config.engine);
    j["dockerBinary"] = config.docker_binary;
    j["dockerUser"] = config.docker_user;
    j["engineCommandTimeoutMs"] = config.engine_command_timeout.count();
    j["measureWithTime"] = config.measure_with_time;
    j["strictIsolation"] = config.strict_isolation;
    j["maxConcurrency"] = config.max_concurrency;
    j["admissionTimeoutMs"] = config.admission_timeout.count();
    j["defaultTimeLimitMs"] = config.default_time_limit.count();
    j["maxTimeLimitMs"] = config.max_time_limit.count();
    j["terminationGraceMs"] = config.termination_grace.count();
    j["defaultMemoryLimitMb"] = config.default_memory_limit_mb;
    j["maxMemoryLimitMb"] = config.max_memory_limit_mb;
    j["defaultCpuLimit"] = config.default_cpu_limit;
    j["pidsLimit"] = config.pids_limit;
    j["maxFileSizeMb"] = config.max_file_size_mb;
    j["allowNetwork"] = config.allow_network;
    j["stdoutCapBytes"] = config.stdout_cap_bytes;
    j["stderrCapBytes"] = config.stderr_cap_bytes;
    j["workRoot"] = config.work_root.string();
    j["defaultRuntime"] = config.default_runtime;

    json runtimes = json::object();
    for (const auto& [name, profile] : config.runtimes) {
        runtimes[name] = {
            {"image", profile.image},
            {"command", profile.command},
            {"entryFile", profile.entry_file}
        };
    }
    j["runtimes"] = runtimes;

    return j.dump(indent);
}

// ============================================================================
// VALIDATION
// ============================================================================

std::vector<std::string> CheckConfigIssues(const RunnerConfig& config) {
    std::vector<std::string> issues;

    if (config.max_concurrency == 0) {
        issues.push_back("maxConcurrency must be at least 1");
    }
    if (config.admission_timeout.count() < 0) {
        issues.push_back("admissionTimeoutMs must not be negative");
    }
    if (config.default_time_limit.count() <= 0) {
        issues.push_back("defaultTimeLimitMs must be > 0");
    }
    if (config.max_time_limit < config.default_time_limit) {
        issues.push_back("maxTimeLimitMs must be >= defaultTimeLimitMs");
    }
    if (config.termination_grace.count() <= 0) {
        issues.push_back("terminationGraceMs must be > 0");
    }
    if (config.default_memory_limit_mb == 0) {
        issues.push_back("defaultMemoryLimitMb must be > 0");
    }
    if (config.max_memory_limit_mb < config.default_memory_limit_mb) {
        issues.push_back("maxMemoryLimitMb must be >= defaultMemoryLimitMb");
    }
    if (config.default_cpu_limit <= 0.0) {
        issues.push_back("defaultCpuLimit must be > 0");
    }
    if (config.stdout_cap_bytes == 0 || config.stderr_cap_bytes == 0) {
        issues.push_back("capture caps must be > 0");
    }
    if (config.work_root.empty()) {
        issues.push_back("workRoot must be set");
    }
    if (config.runtimes.empty()) {
        issues.push_back("at least one runtime profile is required");
    }
    if (!config.runtimes.count(config.default_runtime)) {
        issues.push_back("defaultRuntime '" + config.default_runtime + "' has no profile");
    }
    for (const auto& [name, profile] : config.runtimes) {
        if (profile.image.empty()) {
            issues.push_back("runtime '" + name + "' has no image");
        }
        if (profile.command.empty()) {
            issues.push_back("runtime '" + name + "' has no command");
        }
        if (profile.entry_file.empty() || profile.entry_file.find('/') != std::string::npos) {
            issues.push_back("runtime '" + name + "' needs a plain entryFile name");
        }
    }
    if (config.allow_network) {
        spdlog::warn("Network access is enabled for sandboxed code");
    }

    return issues;
}

} // namespace core
} // namespace timebox
