#include "user/cl_args.hpp"

#include "user/program_options.hpp"

#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gradebox {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ GRADEBOX_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

double parse_timeout(const std::string& opt) {
    std::size_t num_parsed = 0;
    double res = std::stod(opt, &num_parsed);

    if (num_parsed != opt.size()) {
        throw std::invalid_argument(fmt::format("Timeout {:?} is not a number", opt));
    }

    return res;
}

std::int64_t parse_seed(const std::string& opt) {
    std::size_t num_parsed = 0;
    std::int64_t res = std::stoll(opt, &num_parsed);

    if (num_parsed != opt.size()) {
        throw std::invalid_argument(fmt::format("Base seed {:?} is not an integer", opt));
    }

    return res;
}

} // namespace

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("gradebox v{}\nGrades every student submission against a directory of "
                                            "test modules, each run in its own isolated process.",
                                            GRADEBOX_VERSION_STRING));

    // FIXME: argparse is kind of annoying. Behavior is dependant upon ORDER of chained fn calls.

    // clang-format off
    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", GRADEBOX_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
    // Block to reduce scope of `using enum`

    using enum VerbosityLevel;

    constexpr auto DEFAULT_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
    constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

    constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
    constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                if (value > MAX_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification exceeds max level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Log with more verbosity (up to {}x)", MAX_VERBOSITY_INCREASE));

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                if (value < MIN_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity \"quietness\" specification is lower than min level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Log with less verbosity (up to {}x)", MAX_VERBOSITY_DECREASE));

    }

    arg_parser_.add_argument("-s", "--submissions-dir")
        .required()
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.submissions_dir = opt; })
        .help("Root directory containing one folder per student");

    arg_parser_.add_argument("-t", "--tests-dir")
        .required()
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.tests_dir = opt; })
        .help("Directory containing the test modules");

    arg_parser_.add_argument("--target")
        .default_value(std::string{ProgramOptions::DEFAULT_TARGET_FILENAME})
        .nargs(1)
        .metavar("FILE")
        .store_into(opts_buffer_.target_filename)
        .help("Name of the submission module searched for within each student's folder");

    arg_parser_.add_argument("--support-path")
        .metavar("DIR")
        .append()
        .action([this] (const std::string& opt) { opts_buffer_.support_paths.emplace_back(opt); })
        .help("Directory searched for support modules, in priority order (repeatable). Defaults to the tests directory");

    arg_parser_.add_argument("--support-module")
        .metavar("NAME")
        .append()
        .action([this] (const std::string& opt) { opts_buffer_.support_modules.push_back(opt); })
        .help("Support module loaded before each test module (repeatable)");

    arg_parser_.add_argument("--module-name")
        .default_value(std::string{ProgramOptions::DEFAULT_MODULE_NAME})
        .nargs(1)
        .metavar("NAME")
        .store_into(opts_buffer_.module_name)
        .help("Logical name the submission is bound as");

    arg_parser_.add_argument("--timeout")
        .nargs(1)
        .metavar("SECONDS")
        .action([this] (const std::string& opt) { opts_buffer_.timeout_seconds = parse_timeout(opt); })
        .help(fmt::format("Wall-clock limit for each test [default: {}]", ProgramOptions::DEFAULT_TIMEOUT_SECONDS));

    arg_parser_.add_argument("--base-seed")
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) { opts_buffer_.base_seed = parse_seed(opt); })
        .help(fmt::format("Seed of the first test; each following test adds one [default: {}]",
                          ProgramOptions::DEFAULT_BASE_SEED));

    arg_parser_.add_argument("--results-csv")
        .default_value(std::string{ProgramOptions::DEFAULT_RESULTS_CSV})
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.results_csv = opt; })
        .help("Per-test report");

    arg_parser_.add_argument("--summary-csv")
        .default_value(std::string{ProgramOptions::DEFAULT_SUMMARY_CSV})
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.summary_csv = opt; })
        .help("Per-student report");

    arg_parser_.add_argument("--log-file")
        .default_value(std::string{ProgramOptions::DEFAULT_LOG_FILE})
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.log_file = opt; })
        .help("Log file; an empty string disables it");

    arg_parser_.add_argument("--runner")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.runner_path = opt; })
        .help(fmt::format("Runner executable [default: {} next to this executable]",
                          ProgramOptions::DEFAULT_RUNNER_NAME));

    arg_parser_.add_argument("--test-prefix")
        .default_value(std::string{TestCatalog::DEFAULT_PREFIX})
        .nargs(1)
        .metavar("PREFIX")
        .store_into(opts_buffer_.test_prefix)
        .help("File name prefix of test modules");

    arg_parser_.add_argument("--test-suffix")
        .default_value(std::string{TestCatalog::DEFAULT_SUFFIX})
        .nargs(1)
        .metavar("SUFFIX")
        .store_into(opts_buffer_.test_suffix)
        .help("File name suffix of test modules");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    parse_successful_ = false;

    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    if (opts_buffer_.runner_path.empty()) {
        opts_buffer_.runner_path = ProgramOptions::default_runner_path();
    }

    parse_successful_ = true;

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::optional<ProgramOptions> CommandLineArgs::get_options() const {
    if (!parse_successful_) {
        return std::nullopt;
    }

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    ProgramOptions opts = std::move(opts_res).value();

    if (auto valid = opts.validate(); !valid) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(valid.error(), fmt::fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts;
}

} // namespace gradebox
