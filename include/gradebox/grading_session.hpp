#pragma once

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Defines data classes to store result data for the current grading session

namespace gradebox {

/// One student folder of the submissions root, resolved to the module that will be graded
struct SubmissionTarget
{
    /// Student folder name. Group submissions join identifiers with ','
    std::string student_key;

    /// Empty if the target file was not found anywhere within the student's folder
    std::optional<std::filesystem::path> module_path;

    std::vector<std::string> identifiers() const {
        return student_key | ranges::views::split(',') |
               ranges::views::transform([](auto&& part) { return ranges::to<std::string>(part); }) |
               ranges::to<std::vector>();
    }

    bool operator==(const SubmissionTarget& rhs) const = default;
};

struct TestCase
{
    std::string name;
    std::filesystem::path source_path;
    /// Position within the catalog; drives the deterministic seed
    int ordinal_index{};

    bool operator==(const TestCase& rhs) const = default;
};

/// Unit of work handed to a Supervisor
struct ExecutionRequest
{
    std::filesystem::path module_path;
    TestCase test_case;
    std::int64_t seed{};
    std::chrono::duration<double> timeout{};
};

enum class ResultOrigin {
    Runner,            ///< Decoded from a runner's result output
    MissingModule,     ///< Synthesized; the student has no target module
    TimedOut,          ///< The runner was killed after surpassing the timeout
    ProtocolViolation, ///< The runner's output could not be decoded
    LaunchFailure,     ///< The runner process could not be started
};

constexpr std::string_view to_string(ResultOrigin origin) {
    switch (origin) {
    case ResultOrigin::Runner:
        return "runner";
    case ResultOrigin::MissingModule:
        return "missing module";
    case ResultOrigin::TimedOut:
        return "timed out";
    case ResultOrigin::ProtocolViolation:
        return "protocol violation";
    case ResultOrigin::LaunchFailure:
        return "launch failure";
    }
    return "<invalid ResultOrigin>";
}

/// Outcome of exactly one (student, test case) pair
struct ResultRecord
{
    bool ok{};
    std::string message;
    std::optional<std::string> detail;
    std::optional<std::string> stderr_text;
    /// Exit status of the runner, or -signal if it was terminated by a signal
    std::optional<int> exit_code;
    bool timed_out{};
    ResultOrigin origin{ResultOrigin::Runner};

    static ResultRecord missing_module(std::string_view target_filename) {
        return {.ok = false,
                .message = fmt::format("{} not found", target_filename),
                .detail = std::nullopt,
                .stderr_text = std::nullopt,
                .exit_code = std::nullopt,
                .timed_out = false,
                .origin = ResultOrigin::MissingModule};
    }

    /// Text reported for this record: the message, followed by the diagnostic detail, or
    /// the captured stderr if there is no detail
    std::string report_message() const {
        std::string res = message;

        if (detail) {
            res += "\n\nERROR:\n";
            res += *detail;
        } else if (stderr_text && !stderr_text->empty()) {
            res += "\n\nSTDERR:\n";
            res += *stderr_text;
        }

        return res;
    }

    bool operator==(const ResultRecord& rhs) const = default;
};

struct StudentSummary
{
    std::string student_key;
    int total{};
    int passed{};
    int failed{};
    bool missing_module{};

    double percent_passed() const noexcept {
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(passed) / static_cast<double>(total) * 100.0;
    }
};

/// One line of the per-test report
struct TestRow
{
    std::string student_key;
    std::string test_name;
    bool passed{};
    std::string message;
};

struct StudentResult
{
    SubmissionTarget target;
    std::vector<ResultRecord> records;

    int num_passed() const noexcept {
        return gsl::narrow_cast<int>(ranges::count_if(records, &ResultRecord::ok));
    }

    int num_failed() const noexcept { return gsl::narrow_cast<int>(records.size()) - num_passed(); }
};

struct MultiStudentResult
{
    std::vector<StudentResult> results;
};

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::ResultOrigin> : fmt::formatter<std::string_view>
{
    auto format(::gradebox::ResultOrigin from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::gradebox::to_string(from), ctx);
    }
};
