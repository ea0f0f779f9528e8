/**
 * @file code_runner.cpp
 * @brief Implementation of the runner facade
 *
 * @date 2025
 */

#include "timebox/core/code_runner.hpp"
#include "timebox/core/errors.hpp"
#include "timebox/core/result_collector.hpp"
#include "timebox/utils/hash_utils.hpp"
#include "timebox/utils/local_engine.hpp"
#include "timebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace timebox {
namespace core {

// ============================================================================
// ENGINE FACTORY
// ============================================================================

std::unique_ptr<utils::ContainerEngine> CreateEngine(const RunnerConfig& config) {
    switch (config.engine) {
        case EngineKind::DOCKER: {
            utils::DockerEngineOptions options;
            options.binary = config.docker_binary;
            options.user = config.docker_user;
            options.command_timeout = config.engine_command_timeout;
            options.measure_with_time = config.measure_with_time;
            return std::make_unique<utils::DockerEngine>(options);
        }
        case EngineKind::LOCAL_PROCESS: {
            utils::LocalEngineOptions options;
            options.strict_isolation = config.strict_isolation;
            return std::make_unique<utils::LocalProcessEngine>(options);
        }
    }
    throw TimeboxError("Unsupported engine");
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

CodeRunner::CodeRunner(RunnerConfig config)
    : CodeRunner(config, CreateEngine(config)) {
}

CodeRunner::CodeRunner(RunnerConfig config, std::unique_ptr<utils::ContainerEngine> engine)
    : config_(std::move(config))
    , engine_(std::move(engine))
    , registry_(std::make_unique<ImageRegistry>(*engine_, config_.runtimes))
    , limiter_(config_)
    , manager_(std::make_unique<SandboxManager>(*engine_, *registry_, config_))
    , driver_(*engine_) {
    spdlog::debug("Code runner created ({} engine)", engine_->Name());
}

CodeRunner::~CodeRunner() {
    // Manager reclaims leftovers while the engine is still alive
    manager_.reset();
}

// ============================================================================
// INITIALIZATION
// ============================================================================

void CodeRunner::Initialize() {
    spdlog::info("Initializing code runner ({} engine)", engine_->Name());

    auto issues = CheckConfigIssues(config_);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            spdlog::error("Configuration: {}", issue);
        }
        throw TimeboxError("Invalid configuration: " + utils::StringUtils::Join(issues, "; "));
    }

    if (!engine_->IsAvailable()) {
        throw InfrastructureFailure("Container engine '" + engine_->Name() + "' is not available");
    }

    registry_->ResolveAll();

    std::error_code ec;
    std::filesystem::create_directories(config_.work_root, ec);
    if (ec) {
        throw InfrastructureFailure("Cannot create work root " + config_.work_root.string() +
                                    ": " + ec.message());
    }

    initialized_ = true;
    spdlog::info("Code runner ready: {} runtime(s), ceiling {}",
                 registry_->ListRuntimes().size(), config_.max_concurrency);
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult CodeRunner::Run(const ExecutionRequest& request,
                                std::shared_ptr<CancellationToken> token) {
    if (!initialized_) {
        throw TimeboxError("Code runner used before Initialize()");
    }

    const std::string runtime = request.runtime.empty() ? config_.default_runtime
                                                        : request.runtime;
    EffectiveLimits limits = limiter_.Resolve(request);
    std::string digest = utils::HashUtils::ComputeSHA256(request.code);

    spdlog::info("Request {}: runtime {}, code {}, limit {} ms",
                 request.request_id.empty() ? "-" : request.request_id, runtime,
                 utils::HashUtils::ShortDigest(digest), limits.time_limit.count());

    ExecutionResult result;
    try {
        SandboxLease lease = manager_->Acquire(runtime, limits, request.environment);

        RawOutcome raw = driver_.Execute(lease, request, token.get());
        result = ResultCollector::Collect(raw, limits);
        result.sandbox_id = lease.Id();

        SandboxState terminal = ResultCollector::TerminalState(result.status);
        if (terminal != SandboxState::RECLAIMED && lease.State() != terminal) {
            lease.Transition(terminal);
        }
        lease.Release();
    } catch (const AdmissionRejected&) {
        throw;
    } catch (const InvalidRequestError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Request {}: sandbox failure: {}", request.request_id, e.what());
        result = FailureResult(request, e.what());
    }

    result.request_id = request.request_id;
    result.code_sha256 = digest;

    spdlog::info("Request {}: {} in {} ms ({})",
                 request.request_id.empty() ? "-" : request.request_id,
                 StatusToString(result.status), result.duration.count(), result.message);
    return result;
}

std::future<ExecutionResult> CodeRunner::RunAsync(ExecutionRequest request,
                                                  std::shared_ptr<CancellationToken> token) {
    return std::async(std::launch::async,
                      [this, request = std::move(request), token = std::move(token)]() {
                          return Run(request, token);
                      });
}

ExecutionResult CodeRunner::FailureResult(const ExecutionRequest& request,
                                          const std::string& message) const {
    ExecutionResult result;
    result.request_id = request.request_id;
    result.status = ExecutionStatus::INFRASTRUCTURE_FAILURE;
    result.error_kind = ErrorKind::SANDBOX_ERROR;
    result.message = message;
    return result;
}

} // namespace core
} // namespace timebox
