/// \file
/// Wire contract between a runner process and its supervisor: a single JSON object on one line
///
///   {"ok": <bool>, "message": <string>[, "error": <string>]}
///
/// written to the runner's stdout, and nothing else.
#pragma once

#include <gradebox/common/expected.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gradebox::protocol {

struct ResultMessage
{
    bool ok{};
    std::string message;
    /// Full diagnostic text (loader error, exception, fault description)
    std::optional<std::string> error;

    static ResultMessage success(bool passed, std::string message) {
        return {.ok = passed, .message = std::move(message), .error = std::nullopt};
    }

    static ResultMessage failure(std::string message, std::optional<std::string> error = std::nullopt) {
        return {.ok = false, .message = std::move(message), .error = std::move(error)};
    }

    bool operator==(const ResultMessage& rhs) const = default;
};

/// Summary messages emitted by the runner. Kept in one place since the supervisor,
/// the reports and the tests all match on them.
namespace messages {

inline constexpr std::string_view BAD_ARGUMENTS = "bad runner arguments";
inline constexpr std::string_view SUBMISSION_NOT_FOUND = "submission not found";
inline constexpr std::string_view TEST_MODULE_NOT_FOUND = "test module not found";
inline constexpr std::string_view SUBMISSION_LOAD_FAILED = "failed to load submission";
inline constexpr std::string_view SUPPORT_LOAD_FAILED = "failed to load support module";
inline constexpr std::string_view TEST_MODULE_LOAD_FAILED = "failed to load test module";
inline constexpr std::string_view ENTRY_POINT_NOT_FOUND = "entry point not found";
inline constexpr std::string_view TEST_EXCEPTION = "exception during test execution";
inline constexpr std::string_view RUNNER_FAULT = "runner fault";

} // namespace messages

/// Encodes ``msg`` as one line of JSON, including the trailing newline.
/// Invalid UTF-8 in any string field is replaced with U+FFFD rather than rejected.
std::string encode(const ResultMessage& msg);

/// Decodes exactly one result object from ``text``. Surrounding whitespace is permitted.
///
/// A non-string "message" is coerced to its JSON text; a missing "message" decodes as "".
/// A missing or null "error" decodes as std::nullopt.
///
/// On failure, returns a description of why ``text`` is not a valid result.
Expected<ResultMessage, std::string> decode(std::string_view text);

} // namespace gradebox::protocol

template <>
struct fmt::formatter<::gradebox::protocol::ResultMessage> : fmt::formatter<std::string_view>
{
    auto format(const ::gradebox::protocol::ResultMessage& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "ResultMessage {{.ok = {}, .message = {:?}, .error = {}}}", from.ok,
                              from.message, from.error ? fmt::format("{:?}", *from.error) : "none");
    }
};
