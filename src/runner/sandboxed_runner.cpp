#include "runner/sandboxed_runner.hpp"

#include "runner/fatal_signals.hpp"
#include "runner/module_loader.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/protocol/result_message.hpp>
#include <gradebox/test_api.hpp>

#include <boost/core/demangle.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/view/transform.hpp>

#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <typeinfo>
#include <utility>

namespace gradebox {

namespace {

namespace msgs = protocol::messages;

using protocol::ResultMessage;

bool is_present(const std::filesystem::path& path) {
    std::error_code err;
    return std::filesystem::is_regular_file(path, err);
}

/// Name of the type of the exception currently being handled
std::string current_exception_type_name() {
    const std::type_info* type = abi::__cxa_current_exception_type();

    if (type == nullptr) {
        return "<unknown exception type>";
    }

    return boost::core::demangle(type->name());
}

} // namespace

SandboxedRunner::SandboxedRunner(RunnerOptions opts)
    : opts_{std::move(opts)} {}

ResultMessage SandboxedRunner::run() {
    if (!is_present(opts_.module_path)) {
        return ResultMessage::failure(std::string{msgs::SUBMISSION_NOT_FOUND}, opts_.module_path.string());
    }

    if (!is_present(opts_.test_path)) {
        return ResultMessage::failure(std::string{msgs::TEST_MODULE_NOT_FOUND}, opts_.test_path.string());
    }

    set_runner_phase(RunnerPhase::LoadingSubmission);

    if (auto res = loader_.load(opts_.bind_as, opts_.module_path, ModuleLoader::Visibility::Global); !res) {
        return ResultMessage::failure(std::string{msgs::SUBMISSION_LOAD_FAILED}, res.error());
    }

    set_runner_phase(RunnerPhase::LoadingSupport);

    for (const std::string& name : opts_.support_modules) {
        auto path = ModuleLoader::resolve_support(name, opts_.support_paths);

        if (!path) {
            auto search_paths = opts_.support_paths |
                                ranges::views::transform([](const std::filesystem::path& dir) { return dir.string(); });

            return ResultMessage::failure(
                std::string{msgs::SUPPORT_LOAD_FAILED},
                fmt::format("support module {:?} not found in search paths [{}]", name, fmt::join(search_paths, ", ")));
        }

        if (auto res = loader_.load(name, *path, ModuleLoader::Visibility::Global); !res) {
            return ResultMessage::failure(std::string{msgs::SUPPORT_LOAD_FAILED}, res.error());
        }
    }

    // Seeded before the test module is loaded, so that its static initializers see the same sequence too.
    // Test inputs come from test_rng(), which is seeded separately; see seed_test_rng.
    std::srand(static_cast<unsigned>(opts_.seed));

    set_runner_phase(RunnerPhase::LoadingTest);

    const std::string test_name = test_module_name();

    if (auto res = loader_.load(test_name, opts_.test_path, ModuleLoader::Visibility::Local); !res) {
        return ResultMessage::failure(std::string{msgs::TEST_MODULE_LOAD_FAILED}, res.error());
    }

    auto entry_symbol = loader_.find_symbol(test_name, TEST_ENTRY_SYMBOL);

    if (!entry_symbol) {
        return ResultMessage::failure(std::string{msgs::ENTRY_POINT_NOT_FOUND}, entry_symbol.error());
    }

    seed_test_rng(test_name);

    return invoke_entry_point(*entry_symbol);
}

void SandboxedRunner::seed_test_rng(const std::string& test_name) {
    auto seed_symbol = loader_.find_symbol(test_name, SEED_RNG_SYMBOL);

    // Only modules that draw nothing from test_rng() can do without it
    if (!seed_symbol) {
        LOG_WARN("Test module does not seed test_rng(): {}", seed_symbol.error());
        return;
    }

    // Reason: dlsym can only return void*
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto seed_rng = reinterpret_cast<SeedRngFn>(*seed_symbol);

    seed_rng(static_cast<std::uint64_t>(opts_.seed));
}

std::string SandboxedRunner::test_module_name() const {
    std::string name = opts_.test_path.stem().string();

    // Never shadow the submission or a support module
    while (loader_.is_loaded(name)) {
        name.insert(0, "test.");
    }

    return name;
}

ResultMessage SandboxedRunner::invoke_entry_point(void* entry_symbol) {
    // The exported symbol is a pointer to the entry function
    TestEntryFn entry = *static_cast<TestEntryFn*>(entry_symbol);

    if (entry == nullptr) {
        return ResultMessage::failure(std::string{msgs::ENTRY_POINT_NOT_FOUND},
                                      fmt::format("{} is null in {}", TEST_ENTRY_SYMBOL, opts_.test_path.string()));
    }

    set_runner_phase(RunnerPhase::RunningTest);

    try {
        TestOutcome outcome = entry();

        LOG_DEBUG("Test returned passed={} message={:?}", outcome.passed, outcome.message);

        return ResultMessage::success(outcome.passed, std::move(outcome.message));
    } catch (const std::exception& ex) {
        return ResultMessage::failure(std::string{msgs::TEST_EXCEPTION},
                                      fmt::format("{}: {}", current_exception_type_name(), ex.what()));
    } catch (...) {
        // Not derived from std::exception; all that can be reported is its type
        return ResultMessage::failure(std::string{msgs::TEST_EXCEPTION},
                                      fmt::format("{} thrown", current_exception_type_name()));
    }
}

} // namespace gradebox
