#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/common/error_types.hpp>
#include <gradebox/common/posix.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <sys/types.h>

namespace gradebox {

/// A child process running in its own process group, with stdout and stderr captured through pipes.
class Subprocess : NonMovable
{
public:
    /// Prepares a child process that will run ``exec`` with ``args``.
    /// If ``env`` is not given, the child inherits the environment of the current process.
    Subprocess(std::string exec, std::vector<std::string> args,
               std::optional<std::vector<std::string>> env = std::nullopt);
    ~Subprocess();

    /// Forks the current process to start the child.
    /// Returns ExecFailure if the executable could not be run (see ``get_launch_error``)
    Result<void> start();

    /// Collects output until the child exits or ``timeout`` elapses.
    /// Returns TimedOut if the child is still running afterward; it is left running.
    Result<RunResult> wait_for_exit(std::chrono::duration<double> timeout);

    /// Kills the child's whole process group with SIGKILL and reaps the child
    Result<void> kill();

    bool is_alive() const { return child_pid_ != 0 && !run_result_.has_value(); }

    pid_t get_pid() const { return child_pid_; }

    std::optional<RunResult> get_run_result() const { return run_result_; }

    /// Reason for the most recent failure of ``start``
    std::error_code get_launch_error() const { return launch_error_; }

    /// All stdout collected since the process was started. Output past MAX_CAPTURED_BYTES is
    /// discarded and replaced by a trailing "[... N bytes truncated]" line.
    std::string get_stdout() const;

    /// All stderr collected since the process was started; truncated like ``get_stdout``
    std::string get_stderr() const;

    /// Per stream
    static constexpr std::size_t MAX_CAPTURED_BYTES = 16 * 1024 * 1024;

    /// Longest wait ``wait_for_exit`` honors; longer timeouts are clamped to this
    static constexpr std::chrono::hours MAX_WAIT{24 * 365};

private:
    Result<void> create();

    /// Never returns
    [[noreturn]] void init_child(posix::Pipe error_pipe);
    Result<void> init_parent(posix::Pipe error_pipe);

    /// Reads whatever is currently available on both pipes
    void drain_pipes();
    /// Reads from ``fd`` into ``buffer`` until it would block, or a bounded amount has been read.
    /// Closes ``fd`` on EOF.
    static void drain_pipe(int& fd, std::string& buffer, std::size_t& num_discarded);

    /// Non-blocking check for the child having exited
    Result<bool> reap();

    void close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    std::optional<std::vector<std::string>> env_;

    pid_t child_pid_{};
    std::optional<RunResult> run_result_;
    std::error_code launch_error_;

    /// The parent only makes use of the read ends
    posix::Pipe stdout_pipe_{};
    posix::Pipe stderr_pipe_{};

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    /// Bytes read past MAX_CAPTURED_BYTES
    std::size_t stdout_discarded_{};
    std::size_t stderr_discarded_{};
};

} // namespace gradebox
