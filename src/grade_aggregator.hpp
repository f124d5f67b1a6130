#pragma once

#include <gradebox/grading_session.hpp>

#include <map>
#include <string>
#include <vector>

namespace gradebox {

/// Accumulates records into per-student summaries and per-test report rows
class GradeAggregator
{
public:
    /// Starts (or restarts) the summary of ``target``
    const StudentSummary& begin_student(const SubmissionTarget& target);

    /// Counts ``record`` toward the summary of ``target``, which must have been begun.
    /// The returned row is valid until the next call.
    const TestRow& add_result(const SubmissionTarget& target, const TestCase& test, const ResultRecord& record);

    const StudentSummary& get_summary(const std::string& student_key) const;

    /// Sorted by student key
    const std::map<std::string, StudentSummary>& get_summaries() const { return summaries_; }

    /// In the order the records were added
    const std::vector<TestRow>& get_rows() const { return rows_; }

    int num_students_all_passed() const;

private:
    std::map<std::string, StudentSummary> summaries_;
    std::vector<TestRow> rows_;
};

} // namespace gradebox
