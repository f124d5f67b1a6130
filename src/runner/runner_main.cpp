/// Entry point of ``gradebox-runner``: runs one test module against one submission and writes
/// exactly one result message to stdout.

#include "runner/fatal_signals.hpp"
#include "runner/result_channel.hpp"
#include "runner/sandboxed_runner.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/protocol/result_message.hpp>
#include <gradebox/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <vector>

namespace {

using namespace gradebox;

/// Throws on any invalid or missing argument
RunnerOptions parse_args(int argc, const char* argv[]) {
    // No --help or --version, as they exit without producing a result
    argparse::ArgumentParser parser{"gradebox-runner", GRADEBOX_VERSION_STRING, argparse::default_arguments::none};

    parser.add_description("Runs one test module against one submission, writing the result to stdout");

    // clang-format off
    parser.add_argument("--module")
        .required()
        .metavar("PATH")
        .help("submission module to test");

    parser.add_argument("--test")
        .required()
        .metavar("PATH")
        .help("test module to run");

    parser.add_argument("--seed")
        .required()
        .scan<'i', std::int64_t>()
        .metavar("N")
        .help("seed for the deterministic random source");

    parser.add_argument("--bind-as")
        .default_value(std::string{RunnerOptions::DEFAULT_BIND_NAME})
        .metavar("NAME")
        .help("logical name the submission is registered as");

    parser.add_argument("--support-path")
        .default_value(std::vector<std::string>{})
        .append()
        .metavar("DIR")
        .help("directory searched for support modules, in priority order");

    parser.add_argument("--support-module")
        .default_value(std::vector<std::string>{})
        .append()
        .metavar("NAME")
        .help("support module loaded before the test module");
    // clang-format on

    parser.parse_args(argc, argv);

    auto to_path = [](const std::string& str) { return std::filesystem::path{str}; };
    const auto support_paths = parser.get<std::vector<std::string>>("--support-path");

    return RunnerOptions{
        .module_path = parser.get<std::string>("--module"),
        .test_path = parser.get<std::string>("--test"),
        .seed = parser.get<std::int64_t>("--seed"),
        .bind_as = parser.get<std::string>("--bind-as"),
        .support_paths = support_paths | ranges::views::transform(to_path) | ranges::to<std::vector>(),
        .support_modules = parser.get<std::vector<std::string>>("--support-module"),
    };
}

} // namespace

int main(int argc, const char* argv[]) {
    // stderr is captured into the grading record, so keep it to what matters
    init_loggers(spdlog::level::warn);

    ResultChannel channel;

    if (auto res = channel.reserve(); !res) {
        LOG_FATAL("Could not reserve stdout for the result: {}", res.error().message());
        return EXIT_FAILURE;
    }

    if (auto res = install_fatal_signal_handlers(channel.get_fd()); !res) {
        LOG_WARN("Could not install fatal signal handlers: {}", res.error().message());
    }

    protocol::ResultMessage result;

    try {
        SandboxedRunner runner{parse_args(argc, argv)};

        result = runner.run();
    } catch (const std::exception& ex) {
        // SandboxedRunner::run reports its own failures, so this is an argument error
        LOG_ERROR("{}", ex.what());
        result = protocol::ResultMessage::failure(std::string{protocol::messages::BAD_ARGUMENTS}, ex.what());
    }

    if (auto res = channel.emit(result); !res) {
        LOG_FATAL("Could not write the result: {}", res.error().message());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
