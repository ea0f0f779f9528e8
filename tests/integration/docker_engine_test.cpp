/**
 * Docker engine runs against a stand-in docker CLI written in sh, so daemon
 * and container start failures can be reproduced without a daemon.
 */

#include "timebox/core/code_runner.hpp"
#include "timebox/core/errors.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace timebox::core;
using namespace std::chrono_literals;

namespace {

const std::string kDaemonDown =
    "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. "
    "Is the docker daemon running?";

/// docker CLI double; @p start and @p inspect are sh command lists
std::string DockerScript(const std::string& start, const std::string& inspect) {
    return "#!/bin/sh\n"
           "case \"$1\" in\n"
           "  info) echo 24.0.0 ;;\n"
           "  image) echo '[{\"Id\":\"sha256:abc\",\"RepoTags\":[\"python-with-time\"]}]' ;;\n"
           "  create) echo cid123 ;;\n"
           "  start) " + start + " ;;\n"
           "  inspect) " + inspect + " ;;\n"
           "  cp) exit 1 ;;\n"
           "  *) exit 0 ;;\n"
           "esac\n";
}

std::string FailWith(const std::string& message) {
    return "echo '" + message + "' >&2; exit 1";
}

} // namespace

class DockerEngineRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string name =
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        root_ = std::filesystem::temp_directory_path() / ("timebox_docker_" + name);
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);

        config_ = RunnerConfigBuilder(EngineKind::DOCKER)
            .WithMaxConcurrency(1)
            .WithAdmissionTimeout(100ms)
            .WithDefaultTimeLimit(5s)
            .WithTerminationGrace(200ms)
            .WithWorkRoot(root_ / "work")
            .WithDefaultRuntime("python")
            .Build();
        config_.runtimes = {
            {"python", RuntimeProfile{"python-with-time", {"python3", "{file}"}, "client_script.py"}}};
        config_.docker_binary = (root_ / "docker").string();
    }

    void TearDown() override {
        runner_.reset();
        std::filesystem::remove_all(root_);
    }

    CodeRunner& StartRunner(const std::string& script) {
        auto binary = root_ / "docker";
        {
            std::ofstream out(binary, std::ios::trunc);
            out << script;
        }
        std::filesystem::permissions(binary, std::filesystem::perms::owner_all);

        runner_ = std::make_unique<CodeRunner>(config_);
        runner_->Initialize();
        return *runner_;
    }

    static ExecutionRequest PrintRequest() {
        ExecutionRequest request;
        request.code = "print('hi')";
        return request;
    }

    std::filesystem::path root_;
    RunnerConfig config_;
    std::unique_ptr<CodeRunner> runner_;
};

TEST_F(DockerEngineRunTest, DaemonLostAfterCreateIsInfrastructureFailure) {
    auto& runner = StartRunner(DockerScript(FailWith(kDaemonDown), FailWith(kDaemonDown)));

    auto result = runner.Run(PrintRequest());

    EXPECT_EQ(result.status, ExecutionStatus::INFRASTRUCTURE_FAILURE);
    EXPECT_EQ(result.error_kind, ErrorKind::SANDBOX_ERROR);
    EXPECT_NE(result.message.find("Cannot connect to the Docker daemon"), std::string::npos)
        << result.message;
    EXPECT_FALSE(result.exit_code.has_value());
}

TEST_F(DockerEngineRunTest, ContainerThatNeverStartedIsInfrastructureFailure) {
    const std::string created =
        "echo '[{\"State\":{\"Status\":\"created\",\"ExitCode\":128,\"OOMKilled\":false,"
        "\"StartedAt\":\"0001-01-01T00:00:00Z\","
        "\"Error\":\"OCI runtime create failed: exec format error\"}}]'";
    auto& runner = StartRunner(DockerScript(FailWith("Error response from daemon: OCI runtime "
                                                     "create failed: exec format error"),
                                            created));

    auto result = runner.Run(PrintRequest());

    EXPECT_EQ(result.status, ExecutionStatus::INFRASTRUCTURE_FAILURE);
    EXPECT_EQ(result.error_kind, ErrorKind::SANDBOX_ERROR);
    EXPECT_NE(result.message.find("OCI runtime create failed"), std::string::npos)
        << result.message;
    // The client's complaint is a diagnosis, not program output
    EXPECT_TRUE(result.stderr_stream.data.empty());
}

TEST_F(DockerEngineRunTest, StartedContainerKeepsItsOwnExitCode) {
    const std::string exited =
        "echo '[{\"State\":{\"Status\":\"exited\",\"ExitCode\":3,\"OOMKilled\":false,"
        "\"StartedAt\":\"2025-03-01T10:00:00.5Z\",\"Error\":\"\"}}]'";
    auto& runner = StartRunner(DockerScript("echo boom >&2; exit 3", exited));

    auto result = runner.Run(PrintRequest());

    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME_ERROR);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 3);
    EXPECT_EQ(result.stderr_stream.data, "boom\n");
}

TEST_F(DockerEngineRunTest, CleanRunCompletes) {
    const std::string exited =
        "echo '[{\"State\":{\"Status\":\"exited\",\"ExitCode\":0,\"OOMKilled\":false,"
        "\"StartedAt\":\"2025-03-01T10:00:00.5Z\",\"Error\":\"\"}}]'";
    auto& runner = StartRunner(DockerScript("echo hi", exited));

    auto result = runner.Run(PrintRequest());

    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(result.stdout_stream.data, "hi\n");
    EXPECT_EQ(result.message, "Exited normally");
}
