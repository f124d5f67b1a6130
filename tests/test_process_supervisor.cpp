#include "catch2_custom.hpp"

#include "supervisor/process_supervisor.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using gradebox::ExecutionRequest;
using gradebox::ProcessSupervisor;
using gradebox::ResultOrigin;
using gradebox::ResultRecord;
using gradebox::RunResult;
using gradebox::SupervisorConfig;
using gradebox::TestCase;

namespace fs = std::filesystem;

namespace {

/// An executable shell script standing in for the runner
fs::path make_fake_runner(const TempDir& tmp, std::string_view body) {
    auto path = tmp.make_file("fake-runner", fmt::format("#!/bin/sh\n{}\n", body));
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

ExecutionRequest make_request(std::chrono::duration<double> timeout = 10s) {
    return {.module_path = "/s/alice/submission.so",
            .test_case = {.name = "test_a.so", .source_path = "/t/test_a.so", .ordinal_index = 3},
            .seed = 1340,
            .timeout = timeout};
}

ResultRecord run_fake(std::string_view body, std::chrono::duration<double> timeout = 10s) {
    TempDir tmp;
    ProcessSupervisor supervisor{{.runner_path = make_fake_runner(tmp, body),
                                  .bind_name = "submission",
                                  .support_paths = {},
                                  .support_modules = {}}};
    return supervisor.execute(make_request(timeout));
}

} // namespace

TEST_CASE("A valid result is passed through") {
    ResultRecord res = run_fake(R"(echo '{"ok": true, "message": "all good"}')");

    REQUIRE(res.ok);
    REQUIRE(res.message == "all good");
    REQUIRE_FALSE(res.detail);
    REQUIRE_FALSE(res.stderr_text);
    REQUIRE(res.exit_code == std::optional{0});
    REQUIRE_FALSE(res.timed_out);
    REQUIRE(res.origin == ResultOrigin::Runner);
}

TEST_CASE("Stderr is kept alongside the result") {
    ResultRecord res = run_fake(R"(echo "compiler says hi" >&2; echo '{"ok": false, "message": "wrong answer"}')");

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.message == "wrong answer");
    REQUIRE(res.stderr_text == std::optional<std::string>{"compiler says hi\n"});
}

TEST_CASE("Garbage output is a protocol violation that keeps the raw text") {
    ResultRecord res = run_fake(R"(echo "Segmentation fault?"; echo "oops" >&2)");

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.origin == ResultOrigin::ProtocolViolation);
    REQUIRE(res.message == ProcessSupervisor::INVALID_OUTPUT);
    REQUIRE(res.detail == std::optional<std::string>{"STDOUT:\nSegmentation fault?\n\nSTDERR:\noops\n"});
}

TEST_CASE("Empty output with a failing exit") {
    ResultRecord res = run_fake("exit 4");

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.origin == ResultOrigin::ProtocolViolation);
    REQUIRE(res.message == "invalid result output, runner exit code 4");
    REQUIRE(res.exit_code == std::optional{4});
}

TEST_CASE("Empty output after being killed by a signal") {
    ResultRecord res = run_fake("kill -SEGV $$");

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.origin == ResultOrigin::ProtocolViolation);
    REQUIRE(res.message == "invalid result output, runner terminated by signal SIGSEGV");
    REQUIRE(res.exit_code == std::optional{-SIGSEGV});
}

TEST_CASE("A valid result followed by a bad exit keeps the result") {
    SECTION("exit code") {
        ResultRecord res = run_fake(R"(echo '{"ok": true, "message": "done"}'; exit 3)");

        REQUIRE(res.ok);
        REQUIRE(res.origin == ResultOrigin::Runner);
        REQUIRE(res.message == "done (runner exit code: 3)");
        REQUIRE(res.exit_code == std::optional{3});
    }

    SECTION("signal") {
        ResultRecord res = run_fake(R"(echo '{"ok": false, "message": ""}'; kill -ABRT $$)");

        REQUIRE_FALSE(res.ok);
        REQUIRE(res.message == "(runner terminated by signal SIGABRT)");
        REQUIRE(res.exit_code == std::optional{-SIGABRT});
    }
}

TEST_CASE("A runner that never finishes is killed at the timeout") {
    const auto start = std::chrono::steady_clock::now();
    ResultRecord res = run_fake("echo partial >&2; sleep 30", 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.timed_out);
    REQUIRE(res.origin == ResultOrigin::TimedOut);
    REQUIRE(res.message == "timed out after 0.3s");
    REQUIRE(res.stderr_text == std::optional<std::string>{"partial\n"});
    REQUIRE(elapsed >= 300ms);
    REQUIRE(elapsed < 3s);
}

TEST_CASE("A runner that cannot be launched") {
    ProcessSupervisor supervisor{{.runner_path = "/nonexistent/gradebox-runner",
                                  .bind_name = "submission",
                                  .support_paths = {},
                                  .support_modules = {}}};

    ResultRecord res = supervisor.execute(make_request());

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.origin == ResultOrigin::LaunchFailure);
    REQUIRE(res.message == ProcessSupervisor::LAUNCH_FAILED);
    REQUIRE_THAT(res.detail.value(), ContainsSubstring("/nonexistent/gradebox-runner"));
}

TEST_CASE("Runner arguments") {
    ProcessSupervisor supervisor{{.runner_path = "gradebox-runner",
                                  .bind_name = "mylib",
                                  .support_paths = {"/support/a", "/support/b"},
                                  .support_modules = {"helpers"}}};

    const std::vector<std::string> expected = {
        "--module",       "/s/alice/submission.so", //
        "--bind-as",      "mylib",                  //
        "--test",         "/t/test_a.so",           //
        "--seed",         "1340",                   //
        "--support-path", "/support/a",             //
        "--support-path", "/support/b",             //
        "--support-module", "helpers",              //
    };

    REQUIRE(supervisor.runner_args(make_request()) == expected);
}

TEST_CASE("Support paths take priority in the runner's library path") {
    TempDir tmp;

    ::setenv("LD_LIBRARY_PATH", "/inherited/lib", 1);

    ProcessSupervisor supervisor{
        {.runner_path = make_fake_runner(tmp, R"(printf '{"ok": true, "message": "%s"}\n' "$LD_LIBRARY_PATH")"),
         .bind_name = "submission",
         .support_paths = {"/support/a", "/support/b"},
         .support_modules = {}}};

    ResultRecord res = supervisor.execute(make_request());

    ::unsetenv("LD_LIBRARY_PATH");

    REQUIRE(res.ok);
    REQUIRE(res.message == "/support/a:/support/b:/inherited/lib");
}

TEST_CASE("Interpreting runner output directly") {
    ResultRecord res = gradebox::interpret_runner_output(R"({"ok": false, "message": "m", "error": "e"})", "",
                                                         RunResult::make_exited(0));

    REQUIRE(res == ResultRecord{.ok = false,
                                .message = "m",
                                .detail = "e",
                                .stderr_text = std::nullopt,
                                .exit_code = 0,
                                .timed_out = false,
                                .origin = ResultOrigin::Runner});

    REQUIRE_THAT(gradebox::interpret_runner_output("", "", RunResult::make_killed(SIGKILL)).message,
                 StartsWith("invalid result output, runner terminated by signal SIGKILL"));

    REQUIRE(gradebox::timeout_message(20s) == "timed out after 20s");
    REQUIRE(gradebox::timeout_message(1.5s) == "timed out after 1.5s");
}
