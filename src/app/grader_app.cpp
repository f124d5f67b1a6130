#include "app/grader_app.hpp"

#include "multi_student_runner.hpp"
#include "output/csv_serializer.hpp"
#include "output/file_sink.hpp"
#include "output/log_serializer.hpp"
#include "supervisor/process_supervisor.hpp"
#include "test_runner.hpp"
#include "user/program_options.hpp"
#include "user/submission_locator.hpp"
#include "user/test_catalog.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>

#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace gradebox {

int GraderApp::run_impl() {
    try {
        init_loggers(to_log_level(OPTS.verbosity), OPTS.log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        LOG_ERROR("Could not open log file {:?}: {}", OPTS.log_file.string(), ex.what());
        return SETUP_FAULT;
    }

    LOG_DEBUG("Options: {}", OPTS);

    warn_missing_support_paths();

    std::optional tests = discover_tests();
    if (!tests) {
        return SETUP_FAULT;
    }

    auto results_sink = FileSink::open(OPTS.results_csv);
    if (!results_sink) {
        LOG_ERROR("{}", results_sink.error());
        return SETUP_FAULT;
    }

    auto summary_sink = FileSink::open(OPTS.summary_csv);
    if (!summary_sink) {
        LOG_ERROR("{}", summary_sink.error());
        return SETUP_FAULT;
    }

    SubmissionLocator locator{OPTS.target_filename};
    std::vector<SubmissionTarget> targets = locator.locate(OPTS.submissions_dir);

    LOG_DEBUG("Located {} student folder(s), {} without {:?}", targets.size(),
              ranges::count_if(targets, [](const SubmissionTarget& target) { return !target.module_path; }),
              OPTS.target_filename);

    ProcessSupervisor supervisor{{.runner_path = OPTS.runner_path,
                                  .bind_name = OPTS.module_name,
                                  .support_paths = OPTS.effective_support_paths(),
                                  .support_modules = OPTS.support_modules}};

    GradingSettings settings{.base_seed = OPTS.base_seed,
                             .timeout = std::chrono::duration<double>{OPTS.timeout_seconds},
                             .target_filename = OPTS.target_filename};

    std::vector<std::shared_ptr<Serializer>> serializers = {
        std::make_shared<CsvSerializer>(*results_sink, *summary_sink),
        std::make_shared<LogSerializer>(),
    };

    MultiStudentRunner runner{*tests, supervisor, settings, serializers};
    runner.run_all_students(std::move(targets));

    LOG_INFO("Wrote {:?} and {:?}", results_sink->get_path().string(), summary_sink->get_path().string());

    return SUCCESS;
}

std::optional<std::vector<TestCase>> GraderApp::discover_tests() const {
    TestCatalog catalog{OPTS.test_prefix, OPTS.test_suffix};

    auto tests = catalog.discover(OPTS.tests_dir);

    if (!tests) {
        LOG_ERROR("{}", tests.error());
        return std::nullopt;
    }

    if (tests->empty()) {
        LOG_ERROR("No test modules matching {}*{} found in {:?}", OPTS.test_prefix, OPTS.test_suffix,
                  OPTS.tests_dir.string());
        return std::nullopt;
    }

    return std::move(*tests);
}

void GraderApp::warn_missing_support_paths() const {
    for (const auto& dir : OPTS.support_paths) {
        std::error_code err;
        if (!std::filesystem::is_directory(dir, err)) {
            LOG_WARN("Support path {:?} is not a directory", dir.string());
        }
    }
}

} // namespace gradebox
