#include "multi_student_runner.hpp"

#include "grade_aggregator.hpp"
#include "output/serializer.hpp"
#include "test_runner.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>

#include <gsl/util>
#include <range/v3/action/sort.hpp>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace gradebox {

MultiStudentRunner::MultiStudentRunner(const std::vector<TestCase>& tests, Supervisor& supervisor,
                                       GradingSettings settings, std::vector<std::shared_ptr<Serializer>> serializers)
    : test_runner_{tests, supervisor, std::move(settings)}
    , serializers_{std::move(serializers)} {}

template <typename Func>
void MultiStudentRunner::notify(Func&& func) const {
    for (const auto& serializer : serializers_) {
        func(*serializer);
    }
}

MultiStudentResult MultiStudentRunner::run_all_students(std::vector<SubmissionTarget> targets) {
    targets |= ranges::actions::sort(std::less{}, &SubmissionTarget::student_key);

    const std::vector<TestCase>& tests = test_runner_.get_tests();

    notify([&](Serializer& ser) { ser.on_run_begin(tests, gsl::narrow_cast<int>(targets.size())); });

    MultiStudentResult result;
    result.results.reserve(targets.size());

    for (SubmissionTarget& target : targets) {
        aggregator_.begin_student(target);

        notify([&](Serializer& ser) { ser.on_student_begin(target); });

        auto on_result = [&](const TestCase& test, const ResultRecord& record) {
            const TestRow& row = aggregator_.add_result(target, test, record);
            notify([&](Serializer& ser) { ser.on_test_result(row, record); });
        };

        std::vector<ResultRecord> records = test_runner_.run_all(target, on_result);

        const StudentSummary& summary = aggregator_.get_summary(target.student_key);
        LOG_DEBUG("Finished {:?}: {}/{} passed", summary.student_key, summary.passed, summary.total);

        notify([&](Serializer& ser) { ser.on_student_end(summary); });

        result.results.push_back({.target = std::move(target), .records = std::move(records)});
    }

    notify([](Serializer& ser) { ser.finalize(); });

    return result;
}

} // namespace gradebox
