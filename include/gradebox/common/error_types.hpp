#pragma once

#include <gradebox/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace gradebox {

// NOLINTNEXTLINE(performance-enum-size)
enum class ErrorKind {
    TimedOut,       ///< Operation surpassed its (generally user-specified) timeout
    SyscallFailure, ///< A Linux syscall failed
    ExecFailure,    ///< A child process could not be started
    NotFound,       ///< A file or symbol could not be located
    BadProtocol,    ///< Data received from another process did not follow the result protocol
    UnknownError,   ///< As named; use this as little as possible
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::ExecFailure:
        return "ExecFailure";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::BadProtocol:
        return "BadProtocol";
    case ErrorKind::UnknownError:
        return "UnknownError";
    }
    return "<invalid ErrorKind>";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::gradebox::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::gradebox::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propagate the error `e` up
/// the call stack. Otherwise, evaluate to the contained value.
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::gradebox::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, evaluate to the contained value
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
