#include "supervisor/process_supervisor.hpp"

#include "subprocess/subprocess.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/protocol/result_message.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

namespace gradebox {

namespace {

constexpr std::string_view LIBRARY_PATH_VAR = "LD_LIBRARY_PATH=";

std::optional<std::string> non_empty(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    return str;
}

ResultRecord make_failure(std::string_view message, std::string detail, ResultOrigin origin) {
    return {.ok = false,
            .message = std::string{message},
            .detail = std::move(detail),
            .stderr_text = std::nullopt,
            .exit_code = std::nullopt,
            .timed_out = false,
            .origin = origin};
}

} // namespace

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config)
    : config_{std::move(config)} {}

ResultRecord ProcessSupervisor::execute(const ExecutionRequest& request) noexcept {
    try {
        return execute_impl(request);
    } catch (const std::exception& ex) {
        LOG_ERROR("Exception while supervising {:?}: {}", request.test_case.name, ex.what());
        return make_failure(LAUNCH_FAILED, ex.what(), ResultOrigin::LaunchFailure);
    }
}

ResultRecord ProcessSupervisor::execute_impl(const ExecutionRequest& request) {
    LOG_DEBUG("Running {:?} against {:?} (seed={}, timeout={}s)", request.test_case.name,
              request.module_path.string(), request.seed, request.timeout.count());

    Subprocess runner{config_.runner_path.string(), runner_args(request), runner_env()};

    if (auto res = runner.start(); !res) {
        const auto err = runner.get_launch_error();
        std::string reason = err ? err.message() : std::string{to_string(res.error())};

        LOG_ERROR("Could not launch runner {:?}: {}", config_.runner_path.string(), reason);

        return make_failure(LAUNCH_FAILED, fmt::format("{}: {}", config_.runner_path.string(), reason),
                            ResultOrigin::LaunchFailure);
    }

    auto run_result = runner.wait_for_exit(request.timeout);

    if (!run_result) {
        if (auto res = runner.kill(); !res) {
            LOG_WARN("Failed to kill runner {}: {}", runner.get_pid(), res.error());
        }

        std::optional<int> exit_code;
        if (auto ended = runner.get_run_result()) {
            exit_code = ended->exit_code();
        }

        if (run_result.error() == ErrorKind::TimedOut) {
            return {.ok = false,
                    .message = timeout_message(request.timeout),
                    .detail = std::nullopt,
                    .stderr_text = non_empty(runner.get_stderr()),
                    .exit_code = exit_code,
                    .timed_out = true,
                    .origin = ResultOrigin::TimedOut};
        }

        ResultRecord res = make_failure(SUPERVISION_FAILED, std::string{to_string(run_result.error())},
                                        ResultOrigin::LaunchFailure);
        res.stderr_text = non_empty(runner.get_stderr());
        res.exit_code = exit_code;
        return res;
    }

    return interpret_runner_output(runner.get_stdout(), runner.get_stderr(), *run_result);
}

std::vector<std::string> ProcessSupervisor::runner_args(const ExecutionRequest& request) const {
    std::vector<std::string> args = {
        "--module", request.module_path.string(),         //
        "--bind-as", config_.bind_name,                   //
        "--test", request.test_case.source_path.string(), //
        "--seed", std::to_string(request.seed),           //
    };

    for (const auto& dir : config_.support_paths) {
        args.emplace_back("--support-path");
        args.push_back(dir.string());
    }

    for (const auto& name : config_.support_modules) {
        args.emplace_back("--support-module");
        args.push_back(name);
    }

    return args;
}

std::vector<std::string> ProcessSupervisor::runner_env() const {
    std::vector<std::string> env;
    std::vector<std::string> library_dirs;

    for (const auto& dir : config_.support_paths) {
        library_dirs.push_back(dir.string());
    }

    std::optional<std::string> inherited_library_path;

    for (char** var = environ; var != nullptr && *var != nullptr; ++var) {
        std::string_view entry{*var};

        if (entry.starts_with(LIBRARY_PATH_VAR)) {
            inherited_library_path = std::string{entry.substr(LIBRARY_PATH_VAR.size())};
        } else {
            env.emplace_back(entry);
        }
    }

    // Inherited entries come last, so that the support paths take priority
    if (inherited_library_path && !inherited_library_path->empty()) {
        library_dirs.push_back(*inherited_library_path);
    }

    if (!library_dirs.empty()) {
        env.push_back(fmt::format("{}{}", LIBRARY_PATH_VAR, fmt::join(library_dirs, ":")));
    }

    return env;
}

ResultRecord interpret_runner_output(const std::string& stdout_text, const std::string& stderr_text,
                                     const RunResult& run_result) {
    auto decoded = protocol::decode(stdout_text);

    if (!decoded) {
        LOG_DEBUG("Runner output is not a valid result ({}): {:?}", decoded.error(), stdout_text);

        std::string message{ProcessSupervisor::INVALID_OUTPUT};

        if (!run_result.is_success()) {
            message += fmt::format(", runner {}", run_result);
        }

        return {.ok = false,
                .message = std::move(message),
                .detail = fmt::format("STDOUT:\n{}\nSTDERR:\n{}", stdout_text, stderr_text),
                .stderr_text = non_empty(stderr_text),
                .exit_code = run_result.exit_code(),
                .timed_out = false,
                .origin = ResultOrigin::ProtocolViolation};
    }

    protocol::ResultMessage& msg = *decoded;

    if (!run_result.is_success()) {
        const std::string context = run_result.get_kind() == RunResult::Kind::Killed
                                        ? fmt::format("(runner {})", run_result)
                                        : fmt::format("(runner exit code: {})", run_result.get_code());

        msg.message = msg.message.empty() ? context : fmt::format("{} {}", msg.message, context);
    }

    return {.ok = msg.ok,
            .message = std::move(msg.message),
            .detail = std::move(msg.error),
            .stderr_text = non_empty(stderr_text),
            .exit_code = run_result.exit_code(),
            .timed_out = false,
            .origin = ResultOrigin::Runner};
}

std::string timeout_message(std::chrono::duration<double> timeout) {
    return fmt::format("timed out after {:g}s", timeout.count());
}

} // namespace gradebox
