#include "output/csv_serializer.hpp"

#include "output/csv_writer.hpp"
#include "output/sink.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <string>
#include <vector>

namespace gradebox {

CsvSerializer::CsvSerializer(Sink& results_sink, Sink& summary_sink)
    : results_{results_sink}
    , summary_{summary_sink} {}

void CsvSerializer::on_run_begin(const std::vector<TestCase>& /*tests*/, int /*num_students*/) {
    results_.write_row({"student", "test_file", "passed", "message"});
    summary_.write_row({"student", "total_tests", "passed", "failed", "percent_passed", "missing_module"});
}

void CsvSerializer::on_student_begin(const SubmissionTarget& /*target*/) {}

void CsvSerializer::on_test_result(const TestRow& row, const ResultRecord& /*record*/) {
    results_.write_row({row.student_key, row.test_name, row.passed ? "1" : "0", row.message});
}

void CsvSerializer::on_student_end(const StudentSummary& summary) {
    const std::string total = std::to_string(summary.total);
    const std::string passed = std::to_string(summary.passed);
    const std::string failed = std::to_string(summary.failed);
    const std::string percent = format_percent(summary.percent_passed());

    summary_.write_row({summary.student_key, total, passed, failed, percent, summary.missing_module ? "1" : "0"});

    // Keep partial reports usable if a later student brings the grader down
    results_.flush();
    summary_.flush();
}

void CsvSerializer::finalize() {
    results_.flush();
    summary_.flush();

    LOG_DEBUG("CSV reports flushed");
}

std::string CsvSerializer::format_percent(double percent) {
    return fmt::format("{:.2f}", percent);
}

} // namespace gradebox
