/**
 * @file code_runner.hpp
 * @brief Public entry point of the execution core
 *
 * Wires image resolution, admission, provisioning, execution, result
 * collection and reclamation into a single call.
 *
 * **Workflow**:
 * 1. Resolve limits from the request and configuration
 * 2. Admit and provision a fresh sandbox instance (lease)
 * 3. Inject, start, watch and capture
 * 4. Map the termination facts to an ExecutionResult
 * 5. Reclaim the instance (always, on every path)
 *
 * **Usage Example**:
 * @code
 * CodeRunner runner(DefaultRunnerConfig(EngineKind::DOCKER));
 * runner.Initialize();
 *
 * ExecutionRequest request;
 * request.code = "print('hello')";
 * request.time_limit = std::chrono::seconds(2);
 * auto result = runner.Run(request);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "timebox/core/execution_driver.hpp"
#include "timebox/core/execution_types.hpp"
#include "timebox/core/image_registry.hpp"
#include "timebox/core/resource_limiter.hpp"
#include "timebox/core/runner_config.hpp"
#include "timebox/core/sandbox_manager.hpp"
#include "timebox/utils/container_utils.hpp"

#include <future>
#include <memory>

namespace timebox {
namespace core {

/**
 * @class CodeRunner
 * @brief Runs untrusted code in disposable, time-bounded sandboxes
 *
 * Thread-safe: Run() may be called concurrently; the admission gate bounds
 * how many executions are live at once.
 */
class CodeRunner {
public:
    /// Runner with the engine named by the configuration
    explicit CodeRunner(RunnerConfig config);

    /// Runner with an injected engine
    CodeRunner(RunnerConfig config, std::unique_ptr<utils::ContainerEngine> engine);

    ~CodeRunner();

    CodeRunner(const CodeRunner&) = delete;
    CodeRunner& operator=(const CodeRunner&) = delete;

    /**
     * @brief Validate configuration, check the engine, pin every runtime image
     *
     * @throws TimeboxError if the configuration is unusable
     * @throws InfrastructureFailure if the engine is unavailable
     * @throws ImageNotFoundError if a configured image is missing
     */
    void Initialize();

    bool IsInitialized() const { return initialized_; }

    /**
     * @brief Execute one request synchronously
     *
     * Every admitted request yields exactly one result; sandbox failures
     * come back as InfrastructureFailure results.
     *
     * @throws InvalidRequestError for unknown runtimes or invalid limits
     * @throws AdmissionRejected when the pool stays saturated
     */
    ExecutionResult Run(const ExecutionRequest& request,
                        std::shared_ptr<CancellationToken> token = nullptr);

    /// Run() on a separate thread; exceptions surface through the future
    std::future<ExecutionResult> RunAsync(ExecutionRequest request,
                                          std::shared_ptr<CancellationToken> token = nullptr);

    const RunnerConfig& Config() const { return config_; }
    utils::ContainerEngine& Engine() { return *engine_; }
    const ImageRegistry& Registry() const { return *registry_; }
    std::size_t LiveSandboxCount() const { return manager_->LiveCount(); }

private:
    ExecutionResult FailureResult(const ExecutionRequest& request,
                                  const std::string& message) const;

    RunnerConfig config_;
    std::unique_ptr<utils::ContainerEngine> engine_;
    std::unique_ptr<ImageRegistry> registry_;
    ResourceLimiter limiter_;
    std::unique_ptr<SandboxManager> manager_;
    ExecutionDriver driver_;
    bool initialized_{false};
};

/**
 * @brief Construct the engine a configuration asks for
 */
std::unique_ptr<utils::ContainerEngine> CreateEngine(const RunnerConfig& config);

} // namespace core
} // namespace timebox
