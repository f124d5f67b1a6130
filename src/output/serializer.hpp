#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/grading_session.hpp>

#include <vector>

namespace gradebox {

/// Receives grading progress, in order: on_run_begin, then for every student
/// on_student_begin, one on_test_result per test case and on_student_end, and finally finalize
class Serializer : NonCopyable
{
public:
    virtual ~Serializer() = default;

    virtual void on_run_begin(const std::vector<TestCase>& tests, int num_students) = 0;
    virtual void on_student_begin(const SubmissionTarget& target) = 0;
    virtual void on_test_result(const TestRow& row, const ResultRecord& record) = 0;
    virtual void on_student_end(const StudentSummary& summary) = 0;

    virtual void finalize() = 0;
};

} // namespace gradebox
