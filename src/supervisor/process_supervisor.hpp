#pragma once

#include "supervisor/supervisor.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

struct SupervisorConfig
{
    /// The ``gradebox-runner`` executable
    std::filesystem::path runner_path;

    /// Logical name the submission is bound as
    std::string bind_name = "submission";

    /// Priority order
    std::vector<std::filesystem::path> support_paths;
    std::vector<std::string> support_modules;
};

/// Runs each request in a fresh ``gradebox-runner`` process
class ProcessSupervisor final : public Supervisor
{
public:
    explicit ProcessSupervisor(SupervisorConfig config);

    ResultRecord execute(const ExecutionRequest& request) noexcept override;

    /// Command line arguments passed to the runner for ``request``, excluding argv[0]
    std::vector<std::string> runner_args(const ExecutionRequest& request) const;

    /// Environment of the runner: that of the current process, with the support paths
    /// prepended to LD_LIBRARY_PATH
    std::vector<std::string> runner_env() const;

    const SupervisorConfig& get_config() const { return config_; }

    static constexpr std::string_view LAUNCH_FAILED = "failed to launch runner";
    static constexpr std::string_view SUPERVISION_FAILED = "failed to supervise runner";
    static constexpr std::string_view INVALID_OUTPUT = "invalid result output";

private:
    ResultRecord execute_impl(const ExecutionRequest& request);

    SupervisorConfig config_;
};

/// Converts the captured output of a runner that has exited into a record.
///
/// A decodable result always takes precedence; an unsuccessful exit is only appended to its message.
ResultRecord interpret_runner_output(const std::string& stdout_text, const std::string& stderr_text,
                                     const RunResult& run_result);

/// e.g., "timed out after 20s"
std::string timeout_message(std::chrono::duration<double> timeout);

} // namespace gradebox
