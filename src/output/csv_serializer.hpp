#pragma once

#include "output/csv_writer.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <gradebox/grading_session.hpp>

#include <string>
#include <vector>

namespace gradebox {

/// Writes the per-test results report and the per-student summary report
class CsvSerializer final : public Serializer
{
public:
    CsvSerializer(Sink& results_sink, Sink& summary_sink);

    void on_run_begin(const std::vector<TestCase>& tests, int num_students) override;
    void on_student_begin(const SubmissionTarget& target) override;
    void on_test_result(const TestRow& row, const ResultRecord& record) override;
    void on_student_end(const StudentSummary& summary) override;

    void finalize() override;

    /// ``percent`` with exactly two decimals
    static std::string format_percent(double percent);

private:
    CsvWriter results_;
    CsvWriter summary_;
};

} // namespace gradebox
