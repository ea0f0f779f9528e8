#include "timebox/core/errors.hpp"
#include "timebox/reporters/json_reporter.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace timebox::core;
using namespace timebox::reporters;
using json = nlohmann::json;
using namespace std::chrono_literals;

// ============================================================================
// REQUEST PARSING
// ============================================================================

TEST(JsonReporterRequestTest, ParsesFullRequest) {
    auto request = JsonReporter::ParseRequest(R"json({
        "id": "req-7",
        "code": "print(input())",
        "runtime": "python",
        "timeLimitMs": 1500,
        "memoryLimitMb": 64,
        "cpuLimit": 0.25,
        "stdin": "hi\n",
        "env": {"MODE": "test"}
    })json");

    EXPECT_EQ(request.request_id, "req-7");
    EXPECT_EQ(request.code, "print(input())");
    EXPECT_EQ(request.runtime, "python");
    EXPECT_EQ(request.time_limit, 1500ms);
    EXPECT_EQ(request.memory_limit_mb, 64u);
    EXPECT_DOUBLE_EQ(*request.cpu_limit, 0.25);
    EXPECT_EQ(request.stdin_data, "hi\n");
    EXPECT_EQ(request.environment.at("MODE"), "test");
}

TEST(JsonReporterRequestTest, MissingOptionalsStayUnset) {
    auto request = JsonReporter::ParseRequest(R"json({"code": "print(1)"})json");

    EXPECT_FALSE(request.time_limit);
    EXPECT_FALSE(request.memory_limit_mb);
    EXPECT_FALSE(request.cpu_limit);
    EXPECT_TRUE(request.runtime.empty());
    EXPECT_TRUE(request.environment.empty());
}

TEST(JsonReporterRequestTest, RejectsBadRequests) {
    EXPECT_THROW(JsonReporter::ParseRequest("{"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest("\"code\""), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"runtime": "python"})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": 5})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "timeLimitMs": 0})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "timeLimitMs": "soon"})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "timeLimitMs": 1.9})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "timeLimitMs": 1e30})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "timeLimitMs": 10000000000000000000})"),
                 InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "memoryLimitMb": -1})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "env": {"A": 1}})"), InvalidRequestError);
    EXPECT_THROW(JsonReporter::ParseRequest(R"({"code": "", "stdin": 3})"), InvalidRequestError);
}

// ============================================================================
// RESULT SERIALIZATION
// ============================================================================

TEST(JsonReporterResultTest, SerializesCompletedResult) {
    ExecutionResult result;
    result.request_id = "req-1";
    result.sandbox_id = "timebox_1_1";
    result.status = ExecutionStatus::COMPLETED;
    result.stdout_stream.data = "hello\n";
    result.exit_code = 0;
    result.duration = 35ms;
    result.max_memory_kb = 9000;
    result.message = "Exited normally";
    result.code_sha256 = "abc";

    auto j = json::parse(JsonReporter().GenerateResultJson(result));

    EXPECT_EQ(j["id"], "req-1");
    EXPECT_EQ(j["sandboxId"], "timebox_1_1");
    EXPECT_EQ(j["status"], "Completed");
    EXPECT_EQ(j["stdout"], "hello\n");
    EXPECT_EQ(j["stdoutTruncated"], false);
    EXPECT_EQ(j["exitCode"], 0);
    EXPECT_TRUE(j["termSignal"].is_null());
    EXPECT_EQ(j["durationMs"], 35);
    EXPECT_EQ(j["timedOut"], false);
    EXPECT_EQ(j["errorKind"], "None");
    EXPECT_EQ(j["maxMemoryKb"], 9000);
    EXPECT_EQ(j["codeSha256"], "abc");
    EXPECT_FALSE(j.contains("stdoutBytes"));
}

TEST(JsonReporterResultTest, TimedOutResultHasNullExitCode) {
    ExecutionResult result;
    result.status = ExecutionStatus::TIMED_OUT;
    result.timed_out = true;
    result.error_kind = ErrorKind::TIME_LIMIT_EXCEEDED;
    result.stdout_stream.data = "xxxx";
    result.stdout_stream.truncated = true;
    result.stdout_stream.total_bytes = 10;

    JsonReporterConfig config;
    config.include_stream_sizes = true;
    auto j = json::parse(JsonReporter(config).GenerateResultJson(result));

    EXPECT_FALSE(j.contains("id"));
    EXPECT_EQ(j["status"], "TimedOut");
    EXPECT_EQ(j["timedOut"], true);
    EXPECT_TRUE(j["exitCode"].is_null());
    EXPECT_TRUE(j["maxMemoryKb"].is_null());
    EXPECT_EQ(j["errorKind"], "TimeLimitExceeded");
    EXPECT_EQ(j["stdoutTruncated"], true);
    EXPECT_EQ(j["stdoutBytes"], 10);
}

TEST(JsonReporterResultTest, InvalidUtf8IsReplaced) {
    ExecutionResult result;
    result.stdout_stream.data = std::string("ok\xff\xfe", 4);

    std::string text;
    ASSERT_NO_THROW(text = JsonReporter().GenerateResultJson(result));
    auto j = json::parse(text);
    EXPECT_EQ(j["stdout"].get<std::string>().substr(0, 2), "ok");
}

TEST(JsonReporterResultTest, SingleLineByDefault) {
    ExecutionResult result;
    auto text = JsonReporter().GenerateResultJson(result);
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

TEST(JsonReporterResultTest, ErrorDocument) {
    auto j = json::parse(JsonReporter().GenerateErrorJson("AdmissionRejected", "pool saturated", "r9"));
    EXPECT_EQ(j["id"], "r9");
    EXPECT_EQ(j["error"], "AdmissionRejected");
    EXPECT_EQ(j["message"], "pool saturated");
}

TEST(JsonReporterResultTest, CheckDocument) {
    auto config = DefaultRunnerConfig(EngineKind::LOCAL_PROCESS);
    ImageHandle handle;
    handle.runtime = "sh";
    handle.tag = "sh";
    handle.pinned_id = "/bin/sh";
    handle.command = {"{image}", "{file}"};
    handle.entry_file = "main.sh";
    handle.resolved_at = std::chrono::system_clock::from_time_t(0);

    auto j = json::parse(JsonReporter().GenerateCheckJson(config, {handle}, "local"));

    EXPECT_EQ(j["engine"], "local");
    ASSERT_EQ(j["runtimes"].size(), 1u);
    EXPECT_EQ(j["runtimes"][0]["pinnedId"], "/bin/sh");
    EXPECT_EQ(j["runtimes"][0]["command"], json::array({"/bin/sh", "main.sh"}));
    EXPECT_EQ(j["runtimes"][0]["resolvedAt"], "1970-01-01T00:00:00Z");
    EXPECT_EQ(j["config"]["engine"], "local");
}
