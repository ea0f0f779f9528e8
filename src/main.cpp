/**
 * @file main.cpp
 * @brief timebox - Command-line interface
 *
 * Runs untrusted code snippets in disposable, time-bounded sandboxes and
 * prints one JSON result per request on stdout. Logs go to stderr so stdout
 * stays machine readable.
 *
 * **Subcommands**:
 * - `run`: one request from a JSON file, stdin, or a code file plus flags
 * - `batch`: newline-delimited JSON requests on stdin, results as they finish
 * - `check`: validate configuration, engine and images, then print them
 *
 * **Exit Codes**:
 * - 0: result produced
 * - 1: usage, configuration or request error
 * - 2: infrastructure failure (engine down, image missing, sandbox failed)
 * - 3: admission rejected (pool saturated)
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "timebox/core/batch_dispatcher.hpp"
#include "timebox/core/code_runner.hpp"
#include "timebox/core/errors.hpp"
#include "timebox/reporters/json_reporter.hpp"
#include "timebox/utils/string_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInfrastructure = 2;
constexpr int kExitRejected = 3;

/*******************************************************************************
 * Input Helpers
 ******************************************************************************/

std::string ReadInput(const std::string& path) {
    std::ostringstream content;
    if (path == "-") {
        content << std::cin.rdbuf();
        return content.str();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw timebox::core::TimeboxError("Cannot open " + path);
    }
    content << file.rdbuf();
    return content.str();
}

struct RunOptions {
    std::string request_file;
    std::string code_file;
    std::string stdin_file;
    std::string runtime;
    std::string request_id;
    long long time_limit_ms{0};
    std::size_t memory_mb{0};
    double cpu_limit{0.0};
    std::vector<std::string> env;
    bool pretty{false};
};

timebox::core::ExecutionRequest BuildRequest(const RunOptions& options) {
    using timebox::utils::StringUtils;

    timebox::core::ExecutionRequest request;
    if (!options.request_file.empty()) {
        request = timebox::reporters::JsonReporter::ParseRequest(ReadInput(options.request_file));
    } else if (!options.code_file.empty()) {
        request.code = ReadInput(options.code_file);
    } else {
        throw timebox::core::InvalidRequestError("Either a request file or --code-file is required");
    }

    // Flags override fields of the request document
    if (!options.runtime.empty()) {
        request.runtime = options.runtime;
    }
    if (!options.request_id.empty()) {
        request.request_id = options.request_id;
    }
    if (options.time_limit_ms > 0) {
        request.time_limit = std::chrono::milliseconds(options.time_limit_ms);
    }
    if (options.memory_mb > 0) {
        request.memory_limit_mb = options.memory_mb;
    }
    if (options.cpu_limit > 0.0) {
        request.cpu_limit = options.cpu_limit;
    }
    if (!options.stdin_file.empty()) {
        request.stdin_data = ReadInput(options.stdin_file);
    }
    for (const auto& assignment : options.env) {
        auto pair = StringUtils::ParseKeyValue(assignment);
        if (!pair) {
            throw timebox::core::InvalidRequestError("--env expects KEY=VALUE, got '" + assignment + "'");
        }
        request.environment[pair->first] = pair->second;
    }

    return request;
}

int ExitCodeFor(const timebox::core::ExecutionResult& result) {
    return result.status == timebox::core::ExecutionStatus::INFRASTRUCTURE_FAILURE
        ? kExitInfrastructure : kExitOk;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunSingle(timebox::core::CodeRunner& runner, const RunOptions& options) {
    timebox::reporters::JsonReporterConfig reporter_config;
    reporter_config.indent = options.pretty ? 2 : -1;
    timebox::reporters::JsonReporter reporter(reporter_config);

    timebox::core::ExecutionRequest request;
    try {
        request = BuildRequest(options);
        auto result = runner.Run(request);
        std::cout << reporter.GenerateResultJson(result) << std::endl;
        return ExitCodeFor(result);
    } catch (const timebox::core::AdmissionRejected& e) {
        std::cout << reporter.GenerateErrorJson("AdmissionRejected", e.what(), request.request_id)
                  << std::endl;
        return kExitRejected;
    } catch (const timebox::core::InvalidRequestError& e) {
        std::cout << reporter.GenerateErrorJson("InvalidRequest", e.what(), request.request_id)
                  << std::endl;
        return kExitUsage;
    }
}

int RunBatch(timebox::core::CodeRunner& runner) {
    timebox::reporters::JsonReporter reporter;
    std::mutex output_mutex;
    const auto& config = runner.Config();
    timebox::core::BatchDispatcher dispatcher(config.max_concurrency, config.admission_timeout);
    int exit_code = kExitOk;

    auto emit = [&output_mutex](const std::string& line) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << line << std::endl;
    };

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(std::cin, line)) {
        ++line_number;
        if (timebox::utils::StringUtils::Trim(line).empty()) {
            continue;
        }

        timebox::core::ExecutionRequest request;
        try {
            request = timebox::reporters::JsonReporter::ParseRequest(line);
        } catch (const timebox::core::InvalidRequestError& e) {
            spdlog::warn("Line {}: {}", line_number, e.what());
            emit(reporter.GenerateErrorJson("InvalidRequest", e.what()));
            continue;
        }

        // Lines are admitted in input order
        std::string request_id = request.request_id;
        bool started = dispatcher.Dispatch([&runner, &reporter, &emit,
                                            request = std::move(request)]() {
            try {
                auto result = runner.Run(request);
                emit(reporter.GenerateResultJson(result));
                return ExitCodeFor(result);
            } catch (const timebox::core::AdmissionRejected& e) {
                emit(reporter.GenerateErrorJson("AdmissionRejected", e.what(), request.request_id));
                return kExitRejected;
            } catch (const timebox::core::InvalidRequestError& e) {
                emit(reporter.GenerateErrorJson("InvalidRequest", e.what(), request.request_id));
                return kExitUsage;
            }
        });

        if (!started) {
            timebox::core::AdmissionRejected rejected(config.max_concurrency,
                                                      config.admission_timeout);
            spdlog::warn("Line {}: {}", line_number, rejected.what());
            emit(reporter.GenerateErrorJson("AdmissionRejected", rejected.what(), request_id));
            exit_code = std::max(exit_code, kExitRejected);
        }
    }

    std::size_t launched = dispatcher.Launched();
    exit_code = std::max(exit_code, dispatcher.Wait());
    spdlog::info("Batch finished: {} request(s) run", launched);
    return exit_code;
}

int RunCheck(timebox::core::CodeRunner& runner) {
    timebox::reporters::JsonReporterConfig reporter_config;
    reporter_config.indent = 2;
    timebox::reporters::JsonReporter reporter(reporter_config);

    std::cout << reporter.GenerateCheckJson(runner.Config(),
                                            runner.Registry().ResolvedImages(),
                                            runner.Engine().Name())
              << std::endl;
    return kExitOk;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"timebox - sandboxed, time-bounded code execution"};
    app.require_subcommand(1);

    std::string config_path;
    std::string engine_name;
    std::size_t max_concurrency = 0;
    std::string work_root;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--engine", engine_name, "Isolation engine")
        ->check(CLI::IsMember({"docker", "local"}));
    app.add_option("--max-concurrency", max_concurrency, "Live sandbox ceiling");
    app.add_option("--work-root", work_root, "Parent directory of sandbox working directories");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    RunOptions run_options;
    auto* run_cmd = app.add_subcommand("run", "Execute one request");
    run_cmd->add_option("request", run_options.request_file,
                        "Request JSON file ('-' for stdin)");
    run_cmd->add_option("--code-file", run_options.code_file, "Source file to execute ('-' for stdin)");
    run_cmd->add_option("--runtime", run_options.runtime, "Runtime profile name");
    run_cmd->add_option("--id", run_options.request_id, "Correlation id echoed in the result");
    run_cmd->add_option("--time-limit-ms", run_options.time_limit_ms, "Wall-clock limit")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--memory-mb", run_options.memory_mb, "Memory limit")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--cpus", run_options.cpu_limit, "CPU limit in cores")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--env", run_options.env, "Environment variable KEY=VALUE (repeatable)");
    run_cmd->add_option("--stdin-file", run_options.stdin_file, "File fed to standard input");
    run_cmd->add_flag("--pretty", run_options.pretty, "Indent the JSON result");

    auto* batch_cmd = app.add_subcommand("batch", "Execute newline-delimited JSON requests from stdin");
    auto* check_cmd = app.add_subcommand("check", "Validate configuration, engine and images");

    CLI11_PARSE(app, argc, argv);

    // Logs on stderr; stdout carries results only
    auto logger = spdlog::stderr_color_mt("timebox");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        timebox::core::RunnerConfig config;
        if (!config_path.empty()) {
            config = timebox::core::LoadRunnerConfig(config_path);
        } else {
            auto engine = engine_name.empty() ? timebox::core::EngineKind::DOCKER
                                              : timebox::core::ParseEngineKind(engine_name);
            config = timebox::core::DefaultRunnerConfig(engine);
        }

        if (!config_path.empty() && !engine_name.empty()) {
            config.engine = timebox::core::ParseEngineKind(engine_name);
        }
        if (max_concurrency > 0) {
            config.max_concurrency = max_concurrency;
        }
        if (!work_root.empty()) {
            config.work_root = work_root;
        }

        timebox::core::CodeRunner runner(config);
        runner.Initialize();

        if (*run_cmd) {
            return RunSingle(runner, run_options);
        }
        if (*batch_cmd) {
            return RunBatch(runner);
        }
        if (*check_cmd) {
            return RunCheck(runner);
        }
        return kExitUsage;

    } catch (const timebox::core::ImageNotFoundError& e) {
        spdlog::error("{}", e.what());
        return kExitInfrastructure;
    } catch (const timebox::core::InfrastructureFailure& e) {
        spdlog::error("Infrastructure failure: {}", e.what());
        return kExitInfrastructure;
    } catch (const timebox::core::TimeboxError& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return kExitInfrastructure;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitUsage;
    }
}
