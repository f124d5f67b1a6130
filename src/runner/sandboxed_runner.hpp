#pragma once

#include "runner/module_loader.hpp"

#include <gradebox/common/class_traits.hpp>
#include <gradebox/protocol/result_message.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

struct RunnerOptions
{
    std::filesystem::path module_path;
    std::filesystem::path test_path;
    std::int64_t seed{};

    /// Logical name the submission is registered as
    std::string bind_as = std::string{DEFAULT_BIND_NAME};

    /// Priority order
    std::vector<std::filesystem::path> support_paths;
    std::vector<std::string> support_modules;

    static constexpr std::string_view DEFAULT_BIND_NAME = "submission";
};

/// Runs exactly one test module against one submission within the current process
///
/// Every failure is reported through the returned message; nothing is thrown. A fatal signal raised
/// by a loaded module is reported by the fatal signal handlers instead, if installed.
class SandboxedRunner : NonCopyable
{
public:
    explicit SandboxedRunner(RunnerOptions opts);

    protocol::ResultMessage run();

    const ModuleLoader& get_loader() const { return loader_; }

private:
    /// Name the test module is registered as; derived from its file name
    std::string test_module_name() const;

    /// Seeds the test module's test_rng() with the seed itself
    void seed_test_rng(const std::string& test_name);

    protocol::ResultMessage invoke_entry_point(void* entry_symbol);

    RunnerOptions opts_;
    ModuleLoader loader_;
};

} // namespace gradebox
