/**
 * @file execution_driver.cpp
 * @brief Implementation of payload injection, start and capture
 *
 * @date 2025
 */

#include "timebox/core/execution_driver.hpp"
#include "timebox/core/errors.hpp"
#include "timebox/core/image_registry.hpp"
#include "timebox/core/sandbox_manager.hpp"
#include "timebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>
#include <sys/stat.h>

#include <fstream>

namespace timebox {
namespace core {

namespace {

CapturedStream ToCaptured(utils::BoundedBuffer& buffer) {
    CapturedStream stream;
    stream.truncated = buffer.Truncated();
    stream.total_bytes = buffer.TotalBytes();
    stream.data = buffer.Release();
    return stream;
}

/// Keeps a token pointed at a watchdog for exactly the watchdog's lifetime
class TokenAttachment {
public:
    TokenAttachment(CancellationToken* token, Watchdog& watchdog) : token_(token) {
        if (token_) {
            token_->Attach(&watchdog);
        }
    }
    ~TokenAttachment() {
        if (token_) {
            token_->Detach();
        }
    }

    TokenAttachment(const TokenAttachment&) = delete;
    TokenAttachment& operator=(const TokenAttachment&) = delete;

private:
    CancellationToken* token_;
};

constexpr std::size_t kEngineDiagnosticChars = 512;

bool ClientFailed(const RawOutcome& outcome) {
    return !outcome.exit_status || !outcome.exit_status->exited ||
           outcome.exit_status->exit_code != 0;
}

/**
 * @brief Decides whether the engine, not the payload, ended the run
 *
 * A payload that never started is always an engine failure. A failed
 * engine query only counts when the client also failed and the watchdog
 * stayed quiet.
 */
std::optional<std::string> EngineFailure(const RawOutcome& outcome) {
    const auto& info = outcome.engine_info;
    if (!info.payload_started) {
        std::string detail = info.engine_error.value_or(
            utils::StringUtils::Trim(outcome.stderr_stream.data));
        if (detail.empty()) {
            detail = "no diagnostics from the engine";
        }
        return "Container did not start: " +
               utils::StringUtils::Truncate(detail, kEngineDiagnosticChars);
    }
    if (info.engine_error && outcome.reason == TerminationReason::NONE && ClientFailed(outcome)) {
        return "Container engine failure: " +
               utils::StringUtils::Truncate(*info.engine_error, kEngineDiagnosticChars);
    }
    return std::nullopt;
}

} // anonymous namespace

ExecutionDriver::ExecutionDriver(utils::ContainerEngine& engine)
    : engine_(engine) {
}

// ============================================================================
// PAYLOAD INJECTION
// ============================================================================

void ExecutionDriver::InjectPayload(const SandboxLease& lease, const std::string& code) const {
    auto entry = lease.WorkingDirectory() / lease.Image().entry_file;

    std::ofstream file(entry, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw InfrastructureFailure("Cannot write payload to " + entry.string());
    }
    file.write(code.data(), static_cast<std::streamsize>(code.size()));
    file.close();
    if (!file) {
        throw InfrastructureFailure("Short write of payload to " + entry.string());
    }

    if (chmod(entry.c_str(), S_IRUSR | S_IWUSR | S_IXUSR) == -1) {
        spdlog::warn("Cannot mark payload executable: {}", entry.string());
    }
    spdlog::debug("Payload injected: {} ({} bytes)", entry.string(), code.size());
}

// ============================================================================
// EXECUTION
// ============================================================================

RawOutcome ExecutionDriver::Execute(SandboxLease& lease,
                                    const ExecutionRequest& request,
                                    CancellationToken* token) {
    RawOutcome outcome;
    outcome.payload_is_client = engine_.StartsPayloadDirectly();
    const EffectiveLimits& limits = lease.Limits();

    try {
        InjectPayload(lease, request.code);
    } catch (const InfrastructureFailure& e) {
        outcome.infrastructure_error = e.what();
        return outcome;
    }

    if (token && token->IsCancelled()) {
        spdlog::info("Sandbox {}: cancelled before start", lease.Id());
        outcome.reason = TerminationReason::CANCELLED;
        lease.Transition(SandboxState::KILLED);
        return outcome;
    }

    std::unique_ptr<utils::Subprocess> client;
    try {
        client = engine_.Start(lease.EngineId());
    } catch (const InfrastructureFailure& e) {
        spdlog::error("Sandbox {}: start failed: {}", lease.Id(), e.what());
        outcome.infrastructure_error = e.what();
        return outcome;
    }

    lease.Transition(SandboxState::RUNNING);
    outcome.started = true;
    auto start_time = std::chrono::steady_clock::now();

    spdlog::info("Sandbox {}: running (limit {} ms)", lease.Id(), limits.time_limit.count());

    const std::string& engine_id = lease.EngineId();
    utils::Subprocess& process = *client;
    Watchdog watchdog(limits.time_limit, limits.termination_grace,
                      [this, &engine_id, &process](int signal) {
                          engine_.Signal(engine_id, process, signal);
                      });

    utils::StreamPump pump(process, request.stdin_data,
                           limits.stdout_cap_bytes, limits.stderr_cap_bytes);
    {
        TokenAttachment attachment(token, watchdog);
        watchdog.Arm();

        try {
            bool drained = pump.Run([&watchdog] { return watchdog.HardStopReached(); });
            if (!drained) {
                spdlog::error("Sandbox {}: payload ignored SIGKILL, abandoning its streams",
                              lease.Id());
                process.SignalGroup(SIGKILL);
            }
        } catch (const std::exception& e) {
            spdlog::error("Sandbox {}: capture failed: {}", lease.Id(), e.what());
            outcome.infrastructure_error = std::string("Output capture failed: ") + e.what();
            process.SignalGroup(SIGKILL);
        }

        outcome.exit_status = process.Wait();
        watchdog.Disarm();
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    outcome.reason = watchdog.Reason();
    outcome.stdout_stream = ToCaptured(pump.Stdout());
    outcome.stderr_stream = ToCaptured(pump.Stderr());
    outcome.engine_info = engine_.Inspect(engine_id);

    if (!outcome.infrastructure_error) {
        if (auto failure = EngineFailure(outcome)) {
            spdlog::error("Sandbox {}: {}", lease.Id(), *failure);
            outcome.infrastructure_error = std::move(failure);
            if (!outcome.engine_info.payload_started) {
                // Whatever was captured came from the engine client
                outcome.stdout_stream = CapturedStream{};
                outcome.stderr_stream = CapturedStream{};
            }
        }
    }

    spdlog::debug("Sandbox {}: finished after {} ms (watchdog: {})", lease.Id(),
                  outcome.duration.count(), TerminationReasonToString(outcome.reason));

    return outcome;
}

} // namespace core
} // namespace timebox
