#include "subprocess/subprocess.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/common/posix.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <csignal>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gradebox {

namespace {

/// Status the child exits with if it could not exec
constexpr int EXEC_FAILURE_STATUS = 127;

/// Upper bound on how long a poll may block before the child is checked on again
constexpr std::chrono::milliseconds POLL_INTERVAL{10};

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Bounds a single drain, so that a child writing without pause cannot starve the deadline check
constexpr int MAX_CHUNKS_PER_DRAIN = 64;

std::vector<std::string> current_environment() {
    std::vector<std::string> res;

    for (char** var = environ; var != nullptr && *var != nullptr; ++var) {
        res.emplace_back(*var);
    }

    return res;
}

std::string with_truncation_marker(const std::string& text, std::size_t num_discarded) {
    if (num_discarded == 0) {
        return text;
    }
    return fmt::format("{}\n[... {} bytes truncated]", text, num_discarded);
}

void close_if_open(int& fd) {
    if (fd != -1) {
        std::ignore = posix::close(fd);
        fd = -1;
    }
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, std::optional<std::vector<std::string>> env)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , env_{std::move(env)} {}

Subprocess::~Subprocess() {
    if (is_alive()) {
        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill child process {}: {}", child_pid_, res.error());
        }
    }

    close_pipes();
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "a Subprocess may only be started once");

    return create();
}

Result<RunResult> Subprocess::wait_for_exit(std::chrono::duration<double> timeout) {
    using std::chrono::steady_clock;

    if (run_result_) {
        return *run_result_;
    }

    // Converting anything longer to nanoseconds would overflow
    const std::chrono::duration<double> bounded_timeout = std::min(timeout, std::chrono::duration<double>{MAX_WAIT});
    const auto deadline = steady_clock::now() + std::chrono::duration_cast<steady_clock::duration>(bounded_timeout);

    while (true) {
        if (TRY(reap())) {
            // Anything written before exit is still buffered in the pipes
            drain_pipes();
            return *run_result_;
        }

        const auto now = steady_clock::now();
        if (now >= deadline) {
            return ErrorKind::TimedOut;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int poll_ms =
            gsl::narrow_cast<int>(std::clamp(remaining, std::chrono::milliseconds{1}, POLL_INTERVAL).count());

        std::vector<pollfd> fds;
        for (int fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
            if (fd != -1) {
                fds.push_back({.fd = fd, .events = POLLIN, .revents = 0});
            }
        }

        TRYE(posix::poll(fds, poll_ms), SyscallFailure);

        drain_pipes();
    }
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    // The group may not exist yet if the child has not run setpgid; fall back to the child itself
    if (!posix::killpg(child_pid_, SIGKILL)) {
        TRYE(posix::kill(child_pid_, SIGKILL), SyscallFailure);
    }

    auto status = TRYE(posix::waitpid(child_pid_), SyscallFailure);
    run_result_ = RunResult::from_wait_status(status.status);

    drain_pipes();

    return {};
}

Result<void> Subprocess::create() {
    stdout_pipe_ = TRYE(posix::pipe2(), SyscallFailure);
    stderr_pipe_ = TRYE(posix::pipe2(), SyscallFailure);

    // Close-on-exec, so the parent sees EOF as soon as exec succeeds
    posix::Pipe error_pipe = TRYE(posix::pipe2(), SyscallFailure);

    auto fork_res = posix::fork();

    if (!fork_res) {
        launch_error_ = fork_res.error();
        close_if_open(error_pipe.read_fd);
        close_if_open(error_pipe.write_fd);
        close_if_open(stdout_pipe_.write_fd);
        close_if_open(stderr_pipe_.write_fd);
        return ErrorKind::SyscallFailure;
    }

    if (fork_res->which == posix::Fork::Child) {
        init_child(error_pipe);
    }

    child_pid_ = fork_res->pid;

    return init_parent(error_pipe);
}

void Subprocess::init_child(posix::Pipe error_pipe) {
    auto report_and_exit = [&error_pipe](std::error_code err) {
        int errnum = err.value();
        std::ignore = posix::write_all(error_pipe.write_fd, std::string_view{reinterpret_cast<const char*>(&errnum),
                                                                             sizeof(errnum)}); // NOLINT(*-reinterpret-cast)
        _exit(EXEC_FAILURE_STATUS);
    };

    // Own process group, so that everything the child spawns can be killed together
    if (auto res = posix::setpgid(0, 0); !res) {
        report_and_exit(res.error());
    }

    if (auto res = posix::dup2(stdout_pipe_.write_fd, STDOUT_FILENO); !res) {
        report_and_exit(res.error());
    }

    if (auto res = posix::dup2(stderr_pipe_.write_fd, STDERR_FILENO); !res) {
        report_and_exit(res.error());
    }

    // Every other descriptor we opened is close-on-exec
    report_and_exit(posix::execve(exec_, args_, env_ ? *env_ : current_environment()));

    // Unreachable; report_and_exit never returns
    _exit(EXEC_FAILURE_STATUS);
}

Result<void> Subprocess::init_parent(posix::Pipe error_pipe) {
    // Set from both sides, as either may run first. Fails with EACCES if the child has already exec'd,
    // in which case the child has set it itself.
    std::ignore = posix::setpgid(child_pid_, child_pid_);

    close_if_open(stdout_pipe_.write_fd);
    close_if_open(stderr_pipe_.write_fd);
    close_if_open(error_pipe.write_fd);

    // Blocks until the child either execs (EOF) or reports an errno
    std::string errno_bytes;
    while (errno_bytes.size() < sizeof(int)) {
        auto chunk = posix::read(error_pipe.read_fd, sizeof(int) - errno_bytes.size());

        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            break;
        }

        if (chunk->empty()) {
            break;
        }

        errno_bytes += *chunk;
    }

    close_if_open(error_pipe.read_fd);

    if (errno_bytes.size() == sizeof(int)) {
        int errnum{};
        std::memcpy(&errnum, errno_bytes.data(), sizeof(errnum));
        launch_error_ = posix::make_error_code(errnum);

        LOG_DEBUG("Child process failed to exec {:?}: {}", exec_, launch_error_.message());

        auto status = TRYE(posix::waitpid(child_pid_), SyscallFailure);
        run_result_ = RunResult::from_wait_status(status.status);

        return ErrorKind::ExecFailure;
    }

    TRYE(posix::set_nonblocking(stdout_pipe_.read_fd), SyscallFailure);
    TRYE(posix::set_nonblocking(stderr_pipe_.read_fd), SyscallFailure);

    return {};
}

Result<bool> Subprocess::reap() {
    auto res = TRYE(posix::waitpid(child_pid_, WNOHANG), SyscallFailure);

    if (res.pid == 0) {
        return false;
    }

    run_result_ = RunResult::from_wait_status(res.status);

    LOG_TRACE("Child process {} ended with {}", child_pid_, *run_result_);

    return true;
}

std::string Subprocess::get_stdout() const {
    return with_truncation_marker(stdout_buffer_, stdout_discarded_);
}

std::string Subprocess::get_stderr() const {
    return with_truncation_marker(stderr_buffer_, stderr_discarded_);
}

void Subprocess::drain_pipes() {
    drain_pipe(stdout_pipe_.read_fd, stdout_buffer_, stdout_discarded_);
    drain_pipe(stderr_pipe_.read_fd, stderr_buffer_, stderr_discarded_);
}

void Subprocess::drain_pipe(int& fd, std::string& buffer, std::size_t& num_discarded) {
    for (int num_chunks = 0; fd != -1 && num_chunks < MAX_CHUNKS_PER_DRAIN; ++num_chunks) {
        auto chunk = posix::read(fd, READ_CHUNK_SIZE);

        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            if (chunk.error() != std::errc::resource_unavailable_try_again) {
                LOG_WARN("Error reading from child pipe: {}", chunk.error().message());
            }
            return;
        }

        // EOF; every writer has exited or closed its end
        if (chunk->empty()) {
            close_if_open(fd);
            return;
        }

        // Past the limit, keep reading so that the child does not block on a full pipe
        const std::size_t room = MAX_CAPTURED_BYTES - std::min(buffer.size(), MAX_CAPTURED_BYTES);
        const std::size_t num_kept = std::min(room, chunk->size());

        buffer.append(*chunk, 0, num_kept);
        num_discarded += chunk->size() - num_kept;
    }
}

void Subprocess::close_pipes() {
    close_if_open(stdout_pipe_.read_fd);
    close_if_open(stdout_pipe_.write_fd);
    close_if_open(stderr_pipe_.read_fd);
    close_if_open(stderr_pipe_.write_fd);
}

} // namespace gradebox
