#pragma once

#include <gradebox/grading_session.hpp>

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

/// Resolves each student folder of a submissions root to the target module within it
///
/// Traversal order within a student folder is depth-first pre-order: the target file directly
/// within a directory is checked before descending, and subdirectories are visited in byte-wise
/// lexicographic order of their names. Noise directories and symlinked directories are never
/// entered. The first match wins.
class SubmissionLocator
{
public:
    static constexpr std::array<std::string_view, 5> DEFAULT_NOISE_DIRS = {".venv", "venv", "__pycache__", ".git",
                                                                          "node_modules"};
    static constexpr int DEFAULT_SEARCH_DEPTH = 32;

    explicit SubmissionLocator(std::string target_filename);
    SubmissionLocator(std::string target_filename, std::vector<std::string> noise_dirs,
                      int max_depth = DEFAULT_SEARCH_DEPTH);

    /// One target per immediate subdirectory of ``root``, sorted by student key.
    /// Plain files directly within ``root`` are ignored.
    std::vector<SubmissionTarget> locate(const std::filesystem::path& root) const;

    /// Path of the target module within ``student_dir``, or std::nullopt if there is none
    std::optional<std::filesystem::path> locate_one(const std::filesystem::path& student_dir) const;

    const std::string& get_target_filename() const { return target_filename_; }

private:
    std::optional<std::filesystem::path> search_recursive(const std::filesystem::path& dir, int depth_remaining) const;

    /// Subdirectories to descend into, in traversal order
    std::vector<std::filesystem::path> list_subdirs(const std::filesystem::path& dir) const;

    bool is_noise_dir(std::string_view name) const;

    std::string target_filename_;
    std::vector<std::string> noise_dirs_;
    int max_depth_;
};

} // namespace gradebox
