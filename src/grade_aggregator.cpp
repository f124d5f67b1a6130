#include "grade_aggregator.hpp"

#include <gradebox/grading_session.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/map.hpp>

#include <string>

namespace gradebox {

const StudentSummary& GradeAggregator::begin_student(const SubmissionTarget& target) {
    StudentSummary& summary = summaries_[target.student_key];

    summary = StudentSummary{.student_key = target.student_key,
                             .total = 0,
                             .passed = 0,
                             .failed = 0,
                             .missing_module = !target.module_path.has_value()};

    return summary;
}

const TestRow& GradeAggregator::add_result(const SubmissionTarget& target, const TestCase& test,
                                           const ResultRecord& record) {
    auto iter = summaries_.find(target.student_key);
    ASSERT(iter != summaries_.end(), "add_result called before begin_student", target.student_key);

    StudentSummary& summary = iter->second;

    ++summary.total;
    if (record.ok) {
        ++summary.passed;
    } else {
        ++summary.failed;
    }

    rows_.push_back({.student_key = target.student_key,
                     .test_name = test.name,
                     .passed = record.ok,
                     .message = record.report_message()});

    return rows_.back();
}

const StudentSummary& GradeAggregator::get_summary(const std::string& student_key) const {
    auto iter = summaries_.find(student_key);
    ASSERT(iter != summaries_.end(), "unknown student", student_key);

    return iter->second;
}

int GradeAggregator::num_students_all_passed() const {
    return gsl::narrow_cast<int>(ranges::count_if(summaries_ | ranges::views::values, [](const StudentSummary& sum) {
        return sum.total > 0 && sum.passed == sum.total;
    }));
}

} // namespace gradebox
