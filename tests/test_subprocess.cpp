#include "catch2_custom.hpp"

#include "subprocess/subprocess.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <csignal>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace std::chrono_literals;
using gradebox::ErrorKind;
using gradebox::RunResult;
using gradebox::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res);
    REQUIRE(res->is_success());
    REQUIRE(proc.get_stdout() == "Hello world!");
    REQUIRE(proc.get_stderr().empty());
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("Separate stdout and stderr, with the exit code") {
    Subprocess proc("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res);
    REQUIRE(*res == RunResult::make_exited(3));
    REQUIRE(proc.get_stdout() == "out\n");
    REQUIRE(proc.get_stderr() == "err\n");
}

TEST_CASE("Output larger than a pipe buffer is collected") {
    Subprocess proc("/bin/sh", {"-c", "head -c 300000 /dev/zero | tr '\\0' x"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(10s);

    REQUIRE(res);
    REQUIRE(proc.get_stdout().size() == 300000);
}

TEST_CASE("Captured output is capped per stream") {
    constexpr std::size_t num_extra = 1024 * 1024;
    const std::string cmd = fmt::format("head -c {} /dev/zero | tr '\\0' x >&2; echo done",
                                        Subprocess::MAX_CAPTURED_BYTES + num_extra);

    Subprocess proc("/bin/sh", {"-c", cmd});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(30s);
    REQUIRE(res);
    REQUIRE(res->is_success());

    const std::string marker = fmt::format("\n[... {} bytes truncated]", num_extra);
    const std::string err = proc.get_stderr();

    REQUIRE(err.size() == Subprocess::MAX_CAPTURED_BYTES + marker.size());
    REQUIRE(err.ends_with(marker));
    REQUIRE(err.find_first_not_of('x') == Subprocess::MAX_CAPTURED_BYTES);

    // The other stream is unaffected
    REQUIRE(proc.get_stdout() == "done\n");
}

TEST_CASE("Endless output does not delay the timeout") {
    Subprocess proc("/bin/sh", {"-c", "exec cat /dev/zero >&2"});
    REQUIRE(proc.start());

    const auto start = std::chrono::steady_clock::now();
    auto res = proc.wait_for_exit(500ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(res.error() == ErrorKind::TimedOut);
    REQUIRE(elapsed < 3s);
    REQUIRE(proc.kill());
    REQUIRE(proc.get_stderr().size() <= Subprocess::MAX_CAPTURED_BYTES + 64);
}

TEST_CASE("A timeout too large to represent waits for the child") {
    Subprocess proc("/bin/sleep", {"0.2"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(std::chrono::duration<double>{1e12});

    REQUIRE(res);
    REQUIRE(res->is_success());
}

TEST_CASE("Termination by a signal is reported") {
    Subprocess proc("/bin/sh", {"-c", "kill -SEGV $$"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::Killed);
    REQUIRE(res->get_code() == SIGSEGV);
    REQUIRE(res->exit_code() == -SIGSEGV);
}

TEST_CASE("A child that outlives the timeout is left running until killed") {
    Subprocess proc("/bin/sh", {"-c", "echo started; sleep 30"});
    REQUIRE(proc.start());

    const auto start = std::chrono::steady_clock::now();
    auto res = proc.wait_for_exit(200ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(res.error() == ErrorKind::TimedOut);
    REQUIRE(elapsed >= 200ms);
    REQUIRE(elapsed < 2s);
    REQUIRE(proc.is_alive());
    REQUIRE(proc.get_stdout() == "started\n");

    REQUIRE(proc.kill());
    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(proc.get_run_result() == std::optional{RunResult::make_killed(SIGKILL)});
}

TEST_CASE("Killing does not wait for grandchildren holding the pipes") {
    Subprocess proc("/bin/sh", {"-c", "sleep 30 & wait"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit(100ms).error() == ErrorKind::TimedOut);

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(proc.kill());
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);

    REQUIRE(proc.get_run_result() == std::optional{RunResult::make_killed(SIGKILL)});
}

TEST_CASE("Exec failure is reported by start") {
    Subprocess proc("/nonexistent/definitely-not-here", {});

    auto res = proc.start();

    REQUIRE(res.error() == ErrorKind::ExecFailure);
    REQUIRE(proc.get_launch_error() == std::errc::no_such_file_or_directory);
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("An explicit environment replaces the inherited one") {
    Subprocess proc("/bin/sh", {"-c", "printf '%s' \"$GRADEBOX_TEST_VAR\""},
                    std::vector<std::string>{"GRADEBOX_TEST_VAR=from parent", "PATH=/usr/bin:/bin"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit(5s));
    REQUIRE(proc.get_stdout() == "from parent");
}
