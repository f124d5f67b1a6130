#pragma once

#include "app/app.hpp" // IWYU pragma: export

#include <gradebox/grading_session.hpp>

#include <optional>
#include <vector>

namespace gradebox {

/// Grades every student of the submissions directory against every test module of the tests directory
class GraderApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;

    /// Sorted test cases, or std::nullopt after reporting why there are none
    std::optional<std::vector<TestCase>> discover_tests() const;

    void warn_missing_support_paths() const;
};

} // namespace gradebox
