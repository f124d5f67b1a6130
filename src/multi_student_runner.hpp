#pragma once

#include "grade_aggregator.hpp"
#include "output/serializer.hpp"
#include "supervisor/supervisor.hpp"
#include "test_runner.hpp"

#include <gradebox/grading_session.hpp>

#include <memory>
#include <vector>

namespace gradebox {

class MultiStudentRunner
{
public:
    MultiStudentRunner(const std::vector<TestCase>& tests, Supervisor& supervisor, GradingSettings settings,
                       std::vector<std::shared_ptr<Serializer>> serializers);

    /// Grades every target in order of student key, one test case at a time
    MultiStudentResult run_all_students(std::vector<SubmissionTarget> targets);

    const GradeAggregator& get_aggregator() const { return aggregator_; }

private:
    template <typename Func>
    void notify(Func&& func) const;

    SubmissionTestRunner test_runner_;
    std::vector<std::shared_ptr<Serializer>> serializers_;
    GradeAggregator aggregator_;
};

} // namespace gradebox
