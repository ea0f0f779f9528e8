/**
 * End-to-end runs on the local process engine with the `sh` runtime.
 * Python cases are skipped when no python3 interpreter is installed.
 */

#include "timebox/core/code_runner.hpp"
#include "timebox/core/errors.hpp"
#include "timebox/utils/hash_utils.hpp"
#include "timebox/utils/process_utils.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace timebox::core;
using namespace std::chrono_literals;

namespace {

// One stream pump tick plus scheduling noise
constexpr auto kStopSlack = 150ms;

ExecutionRequest ShellRequest(const std::string& code) {
    ExecutionRequest request;
    request.code = code;
    request.runtime = "sh";
    return request;
}

} // namespace

class CodeRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_root_ = std::filesystem::temp_directory_path() /
            ("timebox_it_" + std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(work_root_);

        config_ = RunnerConfigBuilder(EngineKind::LOCAL_PROCESS)
            .WithMaxConcurrency(4)
            .WithAdmissionTimeout(100ms)
            .WithDefaultTimeLimit(5s)
            .WithTerminationGrace(200ms)
            .WithCaptureCaps(1000, 1000)
            .WithWorkRoot(work_root_)
            .WithDefaultRuntime("sh")
            .Build();
        config_.runtimes = {{"sh", RuntimeProfile{"sh", {"{image}", "{file}"}, "main.sh"}}};
    }

    void TearDown() override {
        runner_.reset();
        std::filesystem::remove_all(work_root_);
    }

    CodeRunner& StartRunner() {
        runner_ = std::make_unique<CodeRunner>(config_);
        runner_->Initialize();
        return *runner_;
    }

    bool WorkRootEmpty() const {
        return std::filesystem::is_empty(work_root_);
    }

    std::filesystem::path work_root_;
    RunnerConfig config_;
    std::unique_ptr<CodeRunner> runner_;
};

TEST_F(CodeRunnerTest, RunsHelloWorld) {
    auto& runner = StartRunner();
    auto request = ShellRequest("echo hello");
    request.request_id = "hello-1";

    auto result = runner.Run(request);

    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(result.stdout_stream.data, "hello\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.request_id, "hello-1");
    EXPECT_FALSE(result.sandbox_id.empty());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.code_sha256, timebox::utils::HashUtils::ComputeSHA256("echo hello"));
}

TEST_F(CodeRunnerTest, NonZeroExitIsCrash) {
    auto& runner = StartRunner();
    auto result = runner.Run(ShellRequest("echo oops >&2\nexit 3\n"));

    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_stream.data, "oops\n");
    EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME_ERROR);
}

TEST_F(CodeRunnerTest, TimeoutIsEnforced) {
    auto& runner = StartRunner();
    auto request = ShellRequest("echo started\nsleep 30\n");
    request.time_limit = 300ms;

    auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exit_code);
    EXPECT_EQ(result.stdout_stream.data, "started\n");
    EXPECT_LE(result.duration, request.time_limit.value() + config_.termination_grace + kStopSlack);
    EXPECT_LT(elapsed, 300ms + 200ms + 2s);
}

TEST_F(CodeRunnerTest, IgnoredTermStillStopsWithinGrace) {
    auto& runner = StartRunner();
    auto request = ShellRequest("trap '' TERM\nsleep 30\n");
    request.time_limit = 200ms;

    auto start = std::chrono::steady_clock::now();
    auto result = runner.Run(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error_kind, ErrorKind::TIME_LIMIT_EXCEEDED);
    // Only SIGKILL at the end of the grace period stops it
    EXPECT_GE(result.duration, request.time_limit.value() + config_.termination_grace);
    EXPECT_LE(result.duration, request.time_limit.value() + config_.termination_grace + kStopSlack);
    EXPECT_LT(elapsed, 200ms + 200ms + 2s);
}

TEST_F(CodeRunnerTest, OutputIsCappedNotFailed) {
    auto& runner = StartRunner();
    auto result = runner.Run(ShellRequest("yes a | head -c 100000\n"));

    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(result.stdout_stream.data.size(), 1000u);
    EXPECT_TRUE(result.stdout_stream.truncated);
    EXPECT_EQ(result.stdout_stream.total_bytes, 100000u);
    EXPECT_FALSE(result.stderr_stream.truncated);
}

TEST_F(CodeRunnerTest, FeedsStdinAndEnvironment) {
    auto& runner = StartRunner();
    auto request = ShellRequest("read line\necho \"$GREETING $line\"\n");
    request.stdin_data = "world\n";
    request.environment["GREETING"] = "hello";

    auto result = runner.Run(request);
    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(result.stdout_stream.data, "hello world\n");
}

TEST_F(CodeRunnerTest, PayloadRunsInsideItsWorkingDirectory) {
    auto& runner = StartRunner();
    auto result = runner.Run(ShellRequest("pwd\nls\n"));

    ASSERT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_NE(result.stdout_stream.data.find(result.sandbox_id), std::string::npos);
    EXPECT_NE(result.stdout_stream.data.find("main.sh"), std::string::npos);
}

TEST_F(CodeRunnerTest, CancelWhileRunning) {
    auto& runner = StartRunner();
    auto token = std::make_shared<CancellationToken>();

    auto future = runner.RunAsync(ShellRequest("sleep 30\n"), token);
    std::this_thread::sleep_for(300ms);
    token->Cancel();

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    EXPECT_EQ(result.status, ExecutionStatus::KILLED);
    EXPECT_EQ(result.error_kind, ErrorKind::CANCELLED);
    EXPECT_TRUE(WorkRootEmpty());
}

TEST_F(CodeRunnerTest, CancelBeforeStartRunsNothing) {
    auto& runner = StartRunner();
    auto token = std::make_shared<CancellationToken>();
    token->Cancel();

    auto marker = work_root_ / "ran";
    auto result = runner.Run(ShellRequest("touch " + marker.string() + "\n"), token);

    EXPECT_EQ(result.status, ExecutionStatus::KILLED);
    EXPECT_EQ(result.message, "Cancelled before start");
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(CodeRunnerTest, SandboxesAreFreshAndReclaimed) {
    auto& runner = StartRunner();
    auto first = runner.Run(ShellRequest("echo secret > leftover.txt\n"));
    auto second = runner.Run(ShellRequest("cat leftover.txt\n"));

    EXPECT_EQ(first.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(second.status, ExecutionStatus::CRASHED);
    EXPECT_NE(first.sandbox_id, second.sandbox_id);
    EXPECT_EQ(runner.LiveSandboxCount(), 0u);
    EXPECT_TRUE(WorkRootEmpty());
}

TEST_F(CodeRunnerTest, ConcurrentRunsAllComplete) {
    auto& runner = StartRunner();
    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(runner.RunAsync(ShellRequest("echo " + std::to_string(i) + "\n")));
    }
    for (int i = 0; i < 4; ++i) {
        auto result = futures[i].get();
        EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
        EXPECT_EQ(result.stdout_stream.data, std::to_string(i) + "\n");
    }
    EXPECT_TRUE(WorkRootEmpty());
}

TEST_F(CodeRunnerTest, SaturatedPoolRejects) {
    config_.max_concurrency = 1;
    config_.admission_timeout = 50ms;
    auto& runner = StartRunner();

    auto busy = runner.RunAsync(ShellRequest("sleep 1\n"));
    for (int i = 0; i < 100 && runner.LiveSandboxCount() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(runner.LiveSandboxCount(), 1u);

    EXPECT_THROW(runner.Run(ShellRequest("echo late\n")), AdmissionRejected);
    EXPECT_EQ(busy.get().status, ExecutionStatus::COMPLETED);
}

TEST_F(CodeRunnerTest, InvalidRequestsAreSignalled) {
    auto& runner = StartRunner();

    auto unknown_runtime = ShellRequest("echo");
    unknown_runtime.runtime = "cobol";
    EXPECT_THROW(runner.Run(unknown_runtime), InvalidRequestError);

    auto zero_limit = ShellRequest("echo");
    zero_limit.time_limit = 0ms;
    EXPECT_THROW(runner.Run(zero_limit), InvalidRequestError);
    EXPECT_TRUE(WorkRootEmpty());
}

TEST_F(CodeRunnerTest, RunBeforeInitializeThrows) {
    CodeRunner runner(config_);
    EXPECT_FALSE(runner.IsInitialized());
    EXPECT_THROW(runner.Run(ShellRequest("echo")), TimeboxError);
}

TEST_F(CodeRunnerTest, MissingInterpreterFailsInitialize) {
    config_.runtimes["ghost"] = RuntimeProfile{"timebox-no-such-interpreter", {"{image}", "{file}"}, "main"};
    runner_ = std::make_unique<CodeRunner>(config_);
    EXPECT_THROW(runner_->Initialize(), ImageNotFoundError);
}

TEST_F(CodeRunnerTest, InvalidConfigurationFailsInitialize) {
    config_.max_concurrency = 0;
    runner_ = std::make_unique<CodeRunner>(config_);
    EXPECT_THROW(runner_->Initialize(), TimeboxError);
}

TEST_F(CodeRunnerTest, PythonSyntaxErrorIsCompilationError) {
    if (!timebox::utils::Which("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    config_.runtimes["python"] = RuntimeProfile{"python3", {"{image}", "{file}"}, "client_script.py"};
    auto& runner = StartRunner();

    ExecutionRequest request;
    request.runtime = "python";
    request.code = "print('unterminated'\n";
    request.memory_limit_mb = 512;

    auto result = runner.Run(request);
    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(result.error_kind, ErrorKind::COMPILATION_ERROR);
}
