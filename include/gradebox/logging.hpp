#pragma once

// Set log level based on whether we're in DEBUG mode
// Needs to be done before including spdlog
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cerrno>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

namespace gradebox {

/// Obtain Linux error code message given by ``err`` via libc functions
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Obtain Linux error (i.e., ``errno``) message via libc functions
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

/// Pattern:
///   time - [HH:MM:SS.MS]
///   level (colored, center aligned) - [ info ]
///   process id - [pid 12345]
///   message - "foo bar"
inline constexpr auto LOG_PATTERN = "[%T.%e] [%^%=8l%$] [pid %6P] %v";

/// Sets up the default logger, which writes to stderr (stdout is reserved for program output).
/// If ``log_file`` is given, every message is also appended to that file.
///
/// Throws spdlog::spdlog_ex if the log file cannot be opened.
inline void init_loggers(spdlog::level::level_enum level = spdlog::level::info,
                         const std::filesystem::path& log_file = {}) {
    std::vector<spdlog::sink_ptr> sinks;

    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_st>());

    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_st>(log_file.string(), /*truncate=*/true));
    }

    auto logger = std::make_shared<spdlog::logger>("default", sinks.begin(), sinks.end());

    // Log to stderr. See https://github.com/gabime/spdlog/wiki/FAQ#switch-the-default-logger-to-stderr
    spdlog::set_default_logger(std::move(logger));

    spdlog::set_level(level);
    spdlog::set_pattern(LOG_PATTERN);

    // Override any previously set log-level with the environment variable LOG_LEVEL, if set
    spdlog::cfg::load_env_levels("LOG_LEVEL");
}

} // namespace gradebox
