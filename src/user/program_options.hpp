#pragma once

#include "user/test_catalog.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace gradebox {

/// Console verbosity; each level adds the log messages of the next spdlog level
enum class VerbosityLevel {
    Silent,  ///< Nothing at all
    Quiet,   ///< Warnings and errors only
    Summary, ///< Progress per student and test
    Verbose, ///< Debug messages
    Max      ///< Everything, including trace messages
};

constexpr spdlog::level::level_enum to_log_level(VerbosityLevel level) {
    switch (level) {
    case VerbosityLevel::Silent:
        return spdlog::level::off;
    case VerbosityLevel::Quiet:
        return spdlog::level::warn;
    case VerbosityLevel::Summary:
        return spdlog::level::info;
    case VerbosityLevel::Verbose:
        return spdlog::level::debug;
    case VerbosityLevel::Max:
        return spdlog::level::trace;
    }
    return spdlog::level::info;
}

struct ProgramOptions
{

    // ###### Argument fields

    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// One subdirectory per student
    std::filesystem::path submissions_dir;
    std::filesystem::path tests_dir;

    /// File name searched for within each student's folder
    std::string target_filename = std::string{DEFAULT_TARGET_FILENAME};

    /// Priority order. Empty means just the tests directory
    std::vector<std::filesystem::path> support_paths;
    std::vector<std::string> support_modules;

    /// Logical name the submission is bound as
    std::string module_name = std::string{DEFAULT_MODULE_NAME};

    double timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    std::int64_t base_seed = DEFAULT_BASE_SEED;

    std::filesystem::path results_csv = DEFAULT_RESULTS_CSV;
    std::filesystem::path summary_csv = DEFAULT_SUMMARY_CSV;

    /// Empty disables the log file
    std::filesystem::path log_file = DEFAULT_LOG_FILE;

    std::filesystem::path runner_path;

    std::string test_prefix = std::string{TestCatalog::DEFAULT_PREFIX};
    std::string test_suffix = std::string{TestCatalog::DEFAULT_SUFFIX};

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_TARGET_FILENAME = "submission.so";
    static constexpr std::string_view DEFAULT_MODULE_NAME = "submission";
    static constexpr double DEFAULT_TIMEOUT_SECONDS = 20.0;
    /// One day
    static constexpr double MAX_TIMEOUT_SECONDS = 24.0 * 60 * 60;
    static constexpr std::int64_t DEFAULT_BASE_SEED = 1337;
    static constexpr std::string_view DEFAULT_RESULTS_CSV = "results.csv";
    static constexpr std::string_view DEFAULT_SUMMARY_CSV = "summary.csv";
    static constexpr std::string_view DEFAULT_LOG_FILE = "grading_log.txt";
    static constexpr std::string_view DEFAULT_RUNNER_NAME = "gradebox-runner";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    /// ``gradebox-runner`` in the same directory as the running executable
    static std::filesystem::path default_runner_path() {
        std::error_code err;
        auto self = std::filesystem::read_symlink("/proc/self/exe", err);

        if (err) {
            LOG_WARN("Could not locate the running executable: {}", err.message());
            return DEFAULT_RUNNER_NAME;
        }

        return self.parent_path() / DEFAULT_RUNNER_NAME;
    }

    /// Support paths with the default applied
    std::vector<std::filesystem::path> effective_support_paths() const {
        if (support_paths.empty()) {
            return {tests_dir};
        }
        return support_paths;
    }

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_executable(const std::filesystem::path& path,
                                                            fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path) || ::access(path.c_str(), X_OK) != 0) {
            return (fmt::format(fmt, path.string()) + " is not an executable file");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Clamp verbosity to [MIN, MAX]
        verbosity = std::clamp(verbosity, VerbosityLevel::Silent, VerbosityLevel::Max);

        TRY(ensure_is_directory(submissions_dir, "Submissions directory {:?}"));
        TRY(ensure_is_directory(tests_dir, "Tests directory {:?}"));

        if (!std::isfinite(timeout_seconds) || timeout_seconds <= 0 || timeout_seconds > MAX_TIMEOUT_SECONDS) {
            return fmt::format("Timeout must be a positive number of seconds no greater than {}, got {}",
                               MAX_TIMEOUT_SECONDS, timeout_seconds);
        }

        if (target_filename.empty() || target_filename.find('/') != std::string::npos) {
            return fmt::format("Target {:?} must be a plain file name", target_filename);
        }

        if (module_name.empty()) {
            return std::string{"Module name must not be empty"};
        }

        if (test_suffix.empty() && test_prefix.empty()) {
            return std::string{"At least one of the test prefix and suffix must be non-empty"};
        }

        TRY(ensure_is_executable(runner_path, "Runner {:?}"));

        return {};
    }
};

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::gradebox::ProgramOptions& from, fmt::format_context& ctx) const {
        auto path_strings = [](const std::vector<std::filesystem::path>& paths) {
            return paths | ranges::views::transform([](const std::filesystem::path& path) { return path.string(); });
        };

        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, submissions_dir={:?}, tests_dir={:?}, target={:?}, support_paths={}, "
                              "support_modules={}, module_name={:?}, timeout={}s, base_seed={}, results_csv={:?}, "
                              "summary_csv={:?}, log_file={:?}, runner={:?}, test_pattern={}*{}}}",
                              fmt::underlying(from.verbosity), from.submissions_dir.string(), from.tests_dir.string(),
                              from.target_filename, path_strings(from.support_paths), from.support_modules,
                              from.module_name, from.timeout_seconds, from.base_seed, from.results_csv.string(),
                              from.summary_csv.string(), from.log_file.string(), from.runner_path.string(),
                              from.test_prefix, from.test_suffix);
    }
};
