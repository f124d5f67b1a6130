#pragma once

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers over the syscalls used to spawn and supervise runner processes.
/// Every wrapper returns success/failure and logs failures at debug level.
namespace gradebox::posix {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// see write(2). Retries on short writes and EINTR until all of ``data`` is written.
inline Expected<> write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);
            LOG_DEBUG("write failed: '{}'", err.message());
            return err;
        }

        data.remove_prefix(static_cast<std::size_t>(res));
    }

    return {};
}

/// see read(2). Reads at most ``count`` bytes.
/// An empty string means end-of-file. ``std::errc::resource_unavailable_try_again`` is
/// returned as an error for non-blocking descriptors without data, and is not logged.
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::resource_unavailable_try_again && err != std::errc::interrupted) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// see close(2)
inline Expected<> close(int fd) {
    if (::close(fd) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
inline Expected<> kill(pid_t pid, int sig) {
    if (::kill(pid, sig) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill({}, {}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

/// see killpg(2)
inline Expected<> killpg(pid_t pgrp, int sig) {
    if (::killpg(pgrp, sig) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("killpg({}, {}) failed: '{}'", pgrp, sig, err.message());
        return err;
    }

    return {};
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    if (::setpgid(pid, pgid) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid({}, {}) failed: '{}'", pid, pgid, err.message());
        return err;
    }

    return {};
}

/// args and envp do NOT need to have an extra NULL element; this is added for you.
/// ``args`` excludes argv[0], which is set to ``exec``.
/// see execve(2). Only ever returns on failure.
inline std::error_code execve(const std::string& exec, const std::vector<std::string>& args,
                              const std::vector<std::string>& envp) {
    // Reason: execve requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list;
    std::vector<char*> cstr_envp_list;

    cstr_arg_list.reserve(args.size() + 2);
    cstr_envp_list.reserve(envp.size() + 1);

    cstr_arg_list.push_back(const_cast<char*>(exec.c_str()));
    for (const std::string& arg : args) {
        cstr_arg_list.push_back(const_cast<char*>(arg.c_str()));
    }
    cstr_arg_list.push_back(nullptr);

    for (const std::string& var : envp) {
        cstr_envp_list.push_back(const_cast<char*>(var.c_str()));
    }
    cstr_envp_list.push_back(nullptr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execve(exec.c_str(), cstr_arg_list.data(), cstr_envp_list.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see dup(2)
inline Expected<int> dup(int oldfd) {
    int res = ::fcntl(oldfd, F_DUPFD_CLOEXEC, 0); // NOLINT(*vararg)

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("dup failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see dup2(2)
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        LOG_DEBUG("dup2 failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        res = ::fcntl(fd, cmd, arg.value()); // NOLINT(*vararg)
    } else {
        res = ::fcntl(fd, cmd); // NOLINT(*vararg)
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// Sets O_NONBLOCK on ``fd``
inline Expected<> set_nonblocking(int fd) {
    int pre_flags = TRY(fcntl(fd, F_GETFL));

    TRY(fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK)); // NOLINT(hicpp-signed-bitwise)

    return {};
}

/// see poll(2). EINTR is reported as 0 ready descriptors.
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);
        LOG_DEBUG("poll failed: '{}'", err.message());
        return err;
    }

    return res;
}

struct WaitStatus
{
    pid_t pid; // 0 if WNOHANG was given and the child has not changed state
    int status;
};

/// see waitpid(2). Retries on EINTR.
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = -1;

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("waitpid({}) failed: '{}'", pid, err.message());
        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    int fds[2] = {-1, -1}; // NOLINT(*-avoid-c-arrays)

    if (::pipe2(fds, flags) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe2 failed: '{}'", err.message());
        return err;
    }

    return Pipe{.read_fd = fds[0], .write_fd = fds[1]};
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    /// e.g., "SIGSEGV"
    std::string name() const {
        const char* abbrev = sigabbrev_np(signal_num_);
        if (abbrev == nullptr) {
            return fmt::format("signal {}", signal_num_);
        }
        return fmt::format("SIG{}", abbrev);
    }

    /// e.g., "Segmentation fault"
    std::string description() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr == nullptr ? "Unknown signal" : descr;
    }

private:
    int signal_num_;
};

} // namespace gradebox::posix

template <>
struct fmt::formatter<::gradebox::posix::Signal> : fmt::formatter<std::string_view>
{
    auto format(const ::gradebox::posix::Signal& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(from.name(), ctx);
    }
};
