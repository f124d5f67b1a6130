#include "user/submission_locator.hpp"

#include <gradebox/grading_session.hpp>
#include <gradebox/logging.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

bool is_target_file(const fs::path& path) {
    std::error_code err;
    // Symlinks to regular files are fine
    return fs::is_regular_file(path, err);
}

} // namespace

SubmissionLocator::SubmissionLocator(std::string target_filename)
    : SubmissionLocator{std::move(target_filename),
                        std::vector<std::string>(DEFAULT_NOISE_DIRS.begin(), DEFAULT_NOISE_DIRS.end())} {}

SubmissionLocator::SubmissionLocator(std::string target_filename, std::vector<std::string> noise_dirs, int max_depth)
    : target_filename_{std::move(target_filename)}
    , noise_dirs_{std::move(noise_dirs)}
    , max_depth_{max_depth} {}

std::vector<SubmissionTarget> SubmissionLocator::locate(const fs::path& root) const {
    std::vector<SubmissionTarget> targets;

    std::error_code err;
    fs::directory_iterator iter{root, err};

    if (err) {
        LOG_WARN("Could not read submissions directory {:?}: {}", root.string(), err.message());
        return targets;
    }

    for (; iter != fs::directory_iterator{}; iter.increment(err)) {
        if (err) {
            LOG_WARN("Error while reading submissions directory {:?}: {}", root.string(), err.message());
            break;
        }

        const fs::directory_entry& entry = *iter;
        std::error_code entry_err;

        if (!entry.is_directory(entry_err)) {
            LOG_TRACE("Ignoring non-directory {:?}", entry.path().string());
            continue;
        }

        std::string key = entry.path().filename().string();

        if (is_noise_dir(key)) {
            continue;
        }

        auto module_path = locate_one(entry.path());

        if (module_path) {
            LOG_DEBUG("Found {:?} for {}", module_path->string(), key);
        } else {
            LOG_INFO("No {} found for {}", target_filename_, key);
        }

        targets.push_back({.student_key = std::move(key), .module_path = std::move(module_path)});
    }

    ranges::sort(targets, std::less<>{}, &SubmissionTarget::student_key);

    return targets;
}

std::optional<fs::path> SubmissionLocator::locate_one(const fs::path& student_dir) const {
    return search_recursive(student_dir, max_depth_);
}

std::optional<fs::path> SubmissionLocator::search_recursive(const fs::path& dir, int depth_remaining) const {
    if (auto candidate = dir / target_filename_; is_target_file(candidate)) {
        return candidate;
    }

    if (depth_remaining <= 0) {
        return std::nullopt;
    }

    for (const fs::path& subdir : list_subdirs(dir)) {
        if (auto res = search_recursive(subdir, depth_remaining - 1)) {
            return res;
        }
    }

    return std::nullopt;
}

std::vector<fs::path> SubmissionLocator::list_subdirs(const fs::path& dir) const {
    std::vector<fs::path> subdirs;

    std::error_code err;
    fs::directory_iterator iter{dir, err};

    if (err) {
        LOG_WARN("Skipping unreadable directory {:?}: {}", dir.string(), err.message());
        return subdirs;
    }

    for (; iter != fs::directory_iterator{}; iter.increment(err)) {
        if (err) {
            LOG_WARN("Error while reading directory {:?}: {}", dir.string(), err.message());
            break;
        }

        const fs::directory_entry& entry = *iter;
        std::error_code entry_err;

        if (entry.is_symlink(entry_err) || !entry.is_directory(entry_err)) {
            continue;
        }

        if (is_noise_dir(entry.path().filename().string())) {
            LOG_TRACE("Skipping noise directory {:?}", entry.path().string());
            continue;
        }

        subdirs.push_back(entry.path());
    }

    // Byte-wise order of the names, independent of the locale
    ranges::sort(subdirs, std::less<>{}, [](const fs::path& path) { return path.filename().string(); });

    return subdirs;
}

bool SubmissionLocator::is_noise_dir(std::string_view name) const {
    return ranges::any_of(noise_dirs_, [name](const std::string& noise) { return noise == name; });
}

} // namespace gradebox
