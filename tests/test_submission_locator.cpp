#include "catch2_custom.hpp"

#include "user/submission_locator.hpp"

#include <gradebox/grading_session.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using gradebox::SubmissionLocator;
using gradebox::SubmissionTarget;

namespace fs = std::filesystem;

TEST_CASE("One target per student folder, sorted by key") {
    TempDir tmp;

    tmp.make_file("zoe/submission.so");
    tmp.make_file("alice/submission.so");
    tmp.make_dir("bob");
    tmp.make_file("stray_file.so");
    tmp.make_file(".venv/submission.so");

    SubmissionLocator locator{"submission.so"};
    std::vector<SubmissionTarget> targets = locator.locate(tmp.path());

    const std::vector<std::string> expected_keys = {"alice", "bob", "zoe"};
    REQUIRE(ranges::to<std::vector>(targets | ranges::views::transform(&SubmissionTarget::student_key)) ==
            expected_keys);

    REQUIRE(targets.at(0).module_path == std::optional{tmp.path() / "alice" / "submission.so"});
    REQUIRE_FALSE(targets.at(1).module_path.has_value());
    REQUIRE(targets.at(2).module_path == std::optional{tmp.path() / "zoe" / "submission.so"});
}

TEST_CASE("The shallowest match wins over nested ones") {
    TempDir tmp;

    tmp.make_file("carol/a/submission.so");
    tmp.make_file("carol/submission.so");

    SubmissionLocator locator{"submission.so"};

    REQUIRE(locator.locate_one(tmp.path() / "carol") == std::optional{tmp.path() / "carol" / "submission.so"});
}

TEST_CASE("Subdirectories are searched depth first in name order") {
    TempDir tmp;

    tmp.make_file("dave/b/submission.so");
    tmp.make_file("dave/a/deeper/submission.so");
    tmp.make_file("dave/B/submission.so");

    SubmissionLocator locator{"submission.so"};

    // 'B' < 'a' < 'b' byte-wise
    REQUIRE(locator.locate_one(tmp.path() / "dave") == std::optional{tmp.path() / "dave" / "B" / "submission.so"});

    fs::remove_all(tmp.path() / "dave" / "B");

    // Everything under 'a' is searched before 'b'
    REQUIRE(locator.locate_one(tmp.path() / "dave") ==
            std::optional{tmp.path() / "dave" / "a" / "deeper" / "submission.so"});
}

TEST_CASE("Noise directories and symlinked directories are never entered") {
    TempDir tmp;

    tmp.make_file("erin/.venv/submission.so");
    tmp.make_file("erin/node_modules/pkg/submission.so");
    tmp.make_file("erin/__pycache__/submission.so");
    tmp.make_file("elsewhere/submission.so");
    fs::create_directory_symlink(tmp.path() / "elsewhere", tmp.path() / "erin" / "link");

    SubmissionLocator locator{"submission.so"};
    REQUIRE_FALSE(locator.locate_one(tmp.path() / "erin"));

    tmp.make_file("erin/src/submission.so");
    REQUIRE(locator.locate_one(tmp.path() / "erin") == std::optional{tmp.path() / "erin" / "src" / "submission.so"});
}

TEST_CASE("Custom noise list and depth limit") {
    TempDir tmp;

    tmp.make_file("frank/build/submission.so");
    tmp.make_file("frank/x/y/z/submission.so");

    SubmissionLocator locator{"submission.so", {"build"}, /*max_depth=*/2};

    REQUIRE_FALSE(locator.locate_one(tmp.path() / "frank"));

    SubmissionLocator deeper{"submission.so", {"build"}, /*max_depth=*/3};
    REQUIRE(deeper.locate_one(tmp.path() / "frank") ==
            std::optional{tmp.path() / "frank" / "x" / "y" / "z" / "submission.so"});
}

TEST_CASE("A directory named like the target does not match") {
    TempDir tmp;

    tmp.make_dir("gina/submission.so");

    SubmissionLocator locator{"submission.so"};
    REQUIRE_FALSE(locator.locate_one(tmp.path() / "gina"));
}

TEST_CASE("An unreadable submissions root yields no targets") {
    TempDir tmp;

    SubmissionLocator locator{"submission.so"};
    REQUIRE(locator.locate(tmp.path() / "missing").empty());
}
