#include <gradebox/common/posix.hpp>
#include <gradebox/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <string>

#include <sys/wait.h>

namespace gradebox {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal_num) {
    return {Kind::Killed, signal_num};
}

RunResult RunResult::from_wait_status(int status) {
    if (WIFSIGNALED(status)) {
        return make_killed(WTERMSIG(status));
    }

    ASSERT(WIFEXITED(status), "wait status is neither exited nor signaled", status);

    return make_exited(WEXITSTATUS(status));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

int RunResult::exit_code() const {
    return kind_ == Kind::Killed ? -code_ : code_;
}

std::string RunResult::describe() const {
    if (kind_ == Kind::Killed) {
        return fmt::format("terminated by signal {}", posix::Signal{code_});
    }

    return fmt::format("exit code {}", code_);
}

} // namespace gradebox
