#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace gradebox {

/// How a child process ended
class RunResult
{
public:
    enum class Kind { Exited, Killed };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal_num);

    /// Decodes a status as reported by waitpid(2)
    static RunResult from_wait_status(int status);

    Kind get_kind() const;

    /// Exit status if Exited, signal number if Killed
    int get_code() const;

    /// Exit status, or -signal if the process was killed
    int exit_code() const;

    bool is_success() const { return kind_ == Kind::Exited && code_ == 0; }

    /// e.g., "exit code 3" or "terminated by signal SIGSEGV"
    std::string describe() const;

    bool operator==(const RunResult& rhs) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::RunResult> : fmt::formatter<std::string_view>
{
    auto format(const ::gradebox::RunResult& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(from.describe(), ctx);
    }
};
