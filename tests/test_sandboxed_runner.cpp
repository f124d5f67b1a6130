#include "catch2_custom.hpp"

#include "runner/sandboxed_runner.hpp"

#include <gradebox/protocol/result_message.hpp>

#include <filesystem>
#include <string>

using Catch::Matchers::ContainsSubstring;
using gradebox::RunnerOptions;
using gradebox::SandboxedRunner;
using gradebox::protocol::ResultMessage;

namespace msgs = gradebox::protocol::messages;

namespace {

RunnerOptions options_for(const std::string& submission, const std::string& test) {
    return {.module_path = fixture_path(submission),
            .test_path = fixture_path(test),
            .seed = 1337,
            .bind_as = std::string{RunnerOptions::DEFAULT_BIND_NAME},
            .support_paths = {},
            .support_modules = {}};
}

} // namespace

TEST_CASE("Missing files are reported before anything is loaded") {
    RunnerOptions opts = options_for("submission_good", "test_add_fixed");

    SECTION("submission") {
        opts.module_path = std::filesystem::path{FIXTURES_DIR} / "no_such_submission.so";

        SandboxedRunner runner{opts};
        ResultMessage res = runner.run();

        REQUIRE_FALSE(res.ok);
        REQUIRE(res.message == msgs::SUBMISSION_NOT_FOUND);
        REQUIRE_THAT(res.error.value(), ContainsSubstring("no_such_submission.so"));
        REQUIRE_FALSE(runner.get_loader().is_loaded("submission"));
    }

    SECTION("test module") {
        opts.test_path = std::filesystem::path{FIXTURES_DIR} / "test_nothing.so";

        ResultMessage res = SandboxedRunner{opts}.run();

        REQUIRE_FALSE(res.ok);
        REQUIRE(res.message == msgs::TEST_MODULE_NOT_FOUND);
    }
}

TEST_CASE("A submission that cannot be bound fails to load") {
    ResultMessage res = SandboxedRunner{options_for("submission_unresolved", "test_add_fixed")}.run();

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.message == msgs::SUBMISSION_LOAD_FAILED);
    REQUIRE_THAT(res.error.value(), ContainsSubstring("helper_that_was_never_written"));
}

TEST_CASE("A passing test reports its own message") {
    SandboxedRunner runner{options_for("submission_good", "test_add_fixed")};

    REQUIRE(runner.run() == ResultMessage::success(true, "fixed sums are correct"));
    REQUIRE(runner.get_loader().is_loaded("submission"));
    REQUIRE(runner.get_loader().is_loaded("test_add_fixed"));
}

TEST_CASE("The test module never shadows the submission's name") {
    RunnerOptions opts = options_for("submission_good", "test_add_fixed");
    opts.bind_as = "test_add_fixed";

    SandboxedRunner runner{opts};

    REQUIRE(runner.run().ok);
    REQUIRE(runner.get_loader().path_of("test_add_fixed") == std::optional{fixture_path("submission_good")});
    REQUIRE(runner.get_loader().path_of("test.test_add_fixed") == std::optional{fixture_path("test_add_fixed")});
}

TEST_CASE("Support modules are loaded before the test module") {
    RunnerOptions opts = options_for("submission_good", "test_scaled_add");
    opts.support_paths = {std::filesystem::path{FIXTURES_DIR} / "missing", std::filesystem::path{FIXTURES_DIR} / "support"};
    opts.support_modules = {"scale"};

    SandboxedRunner runner{opts};

    REQUIRE(runner.run() == ResultMessage::success(true, "scaled sum is correct"));
    REQUIRE(runner.get_loader().path_of("scale") ==
            std::optional{std::filesystem::path{FIXTURES_DIR} / "support" / "libscale.so"});
}

TEST_CASE("A support module that cannot be found fails the run") {
    RunnerOptions opts = options_for("submission_good", "test_add_fixed");
    opts.support_paths = {std::filesystem::path{FIXTURES_DIR}};
    opts.support_modules = {"no_such_support"};

    ResultMessage res = SandboxedRunner{opts}.run();

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.message == msgs::SUPPORT_LOAD_FAILED);
    REQUIRE_THAT(res.error.value(), ContainsSubstring("no_such_support"));
}

TEST_CASE("A test module without an entry point") {
    ResultMessage res = SandboxedRunner{options_for("submission_good", "test_no_entry")}.run();

    REQUIRE_FALSE(res.ok);
    REQUIRE(res.message == msgs::ENTRY_POINT_NOT_FOUND);
    REQUIRE_THAT(res.error.value(), ContainsSubstring("gradebox_test_case"));
}

TEST_CASE("Exceptions thrown by a test are reported with their type") {
    SECTION("derived from std::exception") {
        ResultMessage res = SandboxedRunner{options_for("submission_good", "test_throws")}.run();

        REQUIRE_FALSE(res.ok);
        REQUIRE(res.message == msgs::TEST_EXCEPTION);
        REQUIRE(res.error == std::optional<std::string>{"std::runtime_error: checker gave up"});
    }

    SECTION("anything else") {
        ResultMessage res = SandboxedRunner{options_for("submission_good", "test_throws_int")}.run();

        REQUIRE_FALSE(res.ok);
        REQUIRE(res.message == msgs::TEST_EXCEPTION);
        REQUIRE(res.error == std::optional<std::string>{"int thrown"});
    }
}
