/**
 * @file json_reporter.cpp
 * @brief Implementation of the JSON contract
 *
 * Captured output is arbitrary bytes; invalid UTF-8 sequences are replaced
 * with U+FFFD on serialization instead of failing the whole result.
 *
 * @date 2025
 */

#include "timebox/reporters/json_reporter.hpp"
#include "timebox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace timebox {
namespace reporters {

namespace {

std::string Dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

// ============================================================================
// REQUEST PARSING
// ============================================================================

core::ExecutionRequest JsonReporter::ParseRequest(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw core::InvalidRequestError(std::string("Malformed request JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw core::InvalidRequestError("Request must be a JSON object");
    }
    if (!j.contains("code") || !j["code"].is_string()) {
        throw core::InvalidRequestError("Request field 'code' (string) is required");
    }

    core::ExecutionRequest request;
    try {
        request.code = j["code"].get<std::string>();
        request.runtime = j.value("runtime", std::string());
        request.request_id = j.value("id", std::string());
        request.stdin_data = j.value("stdin", std::string());

        if (j.contains("timeLimitMs") && !j["timeLimitMs"].is_null()) {
            const auto& limit = j["timeLimitMs"];
            if (!limit.is_number_integer()) {
                throw core::InvalidRequestError("'timeLimitMs' must be a whole number of milliseconds");
            }
            if (limit.is_number_unsigned() &&
                limit.get<std::uint64_t>() >
                    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw core::InvalidRequestError("'timeLimitMs' is out of range");
            }
            auto millis = limit.get<std::int64_t>();
            if (millis <= 0) {
                throw core::InvalidRequestError("'timeLimitMs' must be > 0");
            }
            request.time_limit = std::chrono::milliseconds(millis);
        }

        if (j.contains("memoryLimitMb") && !j["memoryLimitMb"].is_null()) {
            if (!j["memoryLimitMb"].is_number_integer() || j["memoryLimitMb"].get<long long>() <= 0) {
                throw core::InvalidRequestError("'memoryLimitMb' must be a positive integer");
            }
            request.memory_limit_mb = j["memoryLimitMb"].get<std::size_t>();
        }

        if (j.contains("cpuLimit") && !j["cpuLimit"].is_null()) {
            request.cpu_limit = j["cpuLimit"].get<double>();
        }

        if (j.contains("env") && !j["env"].is_null()) {
            if (!j["env"].is_object()) {
                throw core::InvalidRequestError("'env' must be an object of strings");
            }
            for (const auto& [key, value] : j["env"].items()) {
                if (!value.is_string()) {
                    throw core::InvalidRequestError("'env." + key + "' must be a string");
                }
                request.environment[key] = value.get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        throw core::InvalidRequestError(std::string("Invalid request field: ") + e.what());
    }

    return request;
}

// ============================================================================
// RESULT SERIALIZATION
// ============================================================================

std::string JsonReporter::GenerateResultJson(const core::ExecutionResult& result) const {
    json j;

    if (!result.request_id.empty()) {
        j["id"] = result.request_id;
    }
    j["sandboxId"] = result.sandbox_id;
    j["status"] = core::StatusToString(result.status);
    j["stdout"] = result.stdout_stream.data;
    j["stdoutTruncated"] = result.stdout_stream.truncated;
    j["stderr"] = result.stderr_stream.data;
    j["stderrTruncated"] = result.stderr_stream.truncated;
    j["exitCode"] = OptionalToJson(result.exit_code);
    j["termSignal"] = OptionalToJson(result.term_signal);
    j["durationMs"] = result.duration.count();
    j["timedOut"] = result.timed_out;
    j["errorKind"] = core::ErrorKindToString(result.error_kind);
    j["maxMemoryKb"] = OptionalToJson(result.max_memory_kb);
    j["message"] = result.message;
    j["codeSha256"] = result.code_sha256;

    if (config_.include_stream_sizes) {
        j["stdoutBytes"] = result.stdout_stream.total_bytes;
        j["stderrBytes"] = result.stderr_stream.total_bytes;
    }

    return Dump(j, config_.indent);
}

std::string JsonReporter::GenerateErrorJson(const std::string& error,
                                            const std::string& message,
                                            const std::string& request_id) const {
    json j;
    if (!request_id.empty()) {
        j["id"] = request_id;
    }
    j["error"] = error;
    j["message"] = message;
    return Dump(j, config_.indent);
}

std::string JsonReporter::GenerateCheckJson(const core::RunnerConfig& config,
                                            const std::vector<core::ImageHandle>& images,
                                            const std::string& engine_name) const {
    json j;
    j["engine"] = engine_name;

    json runtimes = json::array();
    for (const auto& image : images) {
        runtimes.push_back({
            {"runtime", image.runtime},
            {"tag", image.tag},
            {"pinnedId", image.pinned_id},
            {"command", core::ImageRegistry::ExpandCommand(image)},
            {"resolvedAt", FormatTimestamp(image.resolved_at)}
        });
    }
    j["runtimes"] = runtimes;

    try {
        j["config"] = json::parse(core::RunnerConfigToJson(config, -1));
    } catch (const json::exception& e) {
        spdlog::error("Cannot embed configuration: {}", e.what());
    }

    return Dump(j, config_.indent);
}

// ============================================================================
// HELPERS
// ============================================================================

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) const {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);
    std::tm tm_value{};
    gmtime_r(&time_t_value, &tm_value);
    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace timebox
