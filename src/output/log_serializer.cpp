#include "output/log_serializer.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

void LogSerializer::on_run_begin(const std::vector<TestCase>& tests, int num_students) {
    num_students_ = num_students;
    num_tests_ = tests.size();

    LOG_INFO("Grading {} student(s) against {} test(s): {}", num_students, tests.size(),
             tests | ranges::views::transform(&TestCase::name));
}

void LogSerializer::on_student_begin(const SubmissionTarget& target) {
    if (target.module_path) {
        LOG_INFO("[{}/{}] {} ({})", num_students_done_ + 1, num_students_, target.student_key,
                 target.module_path->string());
    } else {
        LOG_WARN("[{}/{}] {}: target not found", num_students_done_ + 1, num_students_, target.student_key);
    }
}

void LogSerializer::on_test_result(const TestRow& row, const ResultRecord& record) {
    if (record.ok) {
        LOG_INFO("  PASS {}: {}", row.test_name, excerpt_chars(record.message, MAX_MESSAGE_CHARS));
        return;
    }

    std::string text = fmt::format("  FAIL {} [{}]: {}", row.test_name, record.origin,
                                   excerpt_chars(record.message, MAX_MESSAGE_CHARS));

    if (record.detail) {
        text += fmt::format("\n    detail:\n{}", excerpt_lines(*record.detail, MAX_DETAIL_LINES));
    }

    if (record.stderr_text) {
        text += fmt::format("\n    stderr:\n{}", excerpt_lines(*record.stderr_text, MAX_STDERR_LINES));
    }

    LOG_INFO("{}", text);
}

void LogSerializer::on_student_end(const StudentSummary& summary) {
    ++num_students_done_;

    if (summary.total > 0 && summary.passed == summary.total) {
        ++num_all_passed_;
    }

    LOG_INFO("  {}: {}/{} passed ({:.2f}%)", summary.student_key, summary.passed, summary.total,
             summary.percent_passed());
}

void LogSerializer::finalize() {
    LOG_INFO("Graded {} student(s) on {} test(s); {} passed every test", num_students_done_, num_tests_,
             num_all_passed_);
}

std::string LogSerializer::excerpt_chars(std::string_view str, std::size_t max_chars) {
    if (str.size() <= max_chars) {
        return std::string{str};
    }

    return fmt::format("{}...", str.substr(0, max_chars));
}

std::string LogSerializer::excerpt_lines(std::string_view str, std::size_t max_lines) {
    std::string res;
    std::size_t num_lines = 0;
    std::size_t pos = 0;

    while (pos < str.size()) {
        std::size_t end = str.find('\n', pos);
        if (end == std::string_view::npos) {
            end = str.size();
        }

        if (num_lines < max_lines) {
            res += "      ";
            res += str.substr(pos, end - pos);
            res += '\n';
        }

        ++num_lines;
        pos = end + 1;
    }

    if (num_lines > max_lines) {
        res += fmt::format("      ... ({} more line(s))\n", num_lines - max_lines);
    }

    if (!res.empty()) {
        res.pop_back();
    }

    return res;
}

} // namespace gradebox
