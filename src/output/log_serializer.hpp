#pragma once

#include "output/serializer.hpp"

#include <gradebox/grading_session.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

/// Reports grading progress through the logger, with bounded excerpts of failure diagnostics
class LogSerializer final : public Serializer
{
public:
    void on_run_begin(const std::vector<TestCase>& tests, int num_students) override;
    void on_student_begin(const SubmissionTarget& target) override;
    void on_test_result(const TestRow& row, const ResultRecord& record) override;
    void on_student_end(const StudentSummary& summary) override;

    void finalize() override;

    static constexpr std::size_t MAX_MESSAGE_CHARS = 300;
    static constexpr std::size_t MAX_DETAIL_LINES = 20;
    static constexpr std::size_t MAX_STDERR_LINES = 10;

    /// At most ``max_chars`` of ``str``, marked with "..." if truncated
    static std::string excerpt_chars(std::string_view str, std::size_t max_chars);

    /// At most the first ``max_lines`` lines of ``str``, followed by a count of the omitted lines
    static std::string excerpt_lines(std::string_view str, std::size_t max_lines);

private:
    int num_students_ = 0;
    int num_students_done_ = 0;
    int num_all_passed_ = 0;
    std::size_t num_tests_ = 0;
};

} // namespace gradebox
