#include "user/test_catalog.hpp"

#include <gradebox/common/expected.hpp>
#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/sort.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;

TestCatalog::TestCatalog(std::string prefix, std::string suffix)
    : prefix_{std::move(prefix)}
    , suffix_{std::move(suffix)} {}

Expected<std::vector<TestCase>, std::string> TestCatalog::discover(const fs::path& tests_dir) const {
    std::vector<TestCase> tests;

    std::error_code err;
    fs::directory_iterator iter{tests_dir, err};

    if (err) {
        return fmt::format("Could not read tests directory {:?}: {}", tests_dir.string(), err.message());
    }

    for (; iter != fs::directory_iterator{}; iter.increment(err)) {
        if (err) {
            return fmt::format("Error while reading tests directory {:?}: {}", tests_dir.string(), err.message());
        }

        const fs::directory_entry& entry = *iter;
        std::error_code entry_err;
        std::string filename = entry.path().filename().string();

        if (!matches(filename) || !entry.is_regular_file(entry_err)) {
            continue;
        }

        tests.push_back({.name = std::move(filename), .source_path = entry.path(), .ordinal_index = 0});
    }

    ranges::sort(tests, std::less<>{}, &TestCase::name);

    for (std::size_t i = 0; i < tests.size(); ++i) {
        tests[i].ordinal_index = gsl::narrow_cast<int>(i);
    }

    LOG_DEBUG("Discovered {} test modules in {:?}", tests.size(), tests_dir.string());

    return tests;
}

bool TestCatalog::matches(std::string_view filename) const {
    return filename.size() > prefix_.size() + suffix_.size() && filename.starts_with(prefix_) &&
           filename.ends_with(suffix_);
}

} // namespace gradebox
