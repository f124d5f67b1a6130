#include "output/file_sink.hpp"

#include <gradebox/common/expected.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace gradebox {

FileSink::FileSink(std::filesystem::path path, std::ofstream stream)
    : path_{std::move(path)}
    , stream_{std::move(stream)} {}

Expected<FileSink, std::string> FileSink::open(const std::filesystem::path& path) {
    std::ofstream stream{path, std::ios::out | std::ios::trunc | std::ios::binary};

    if (!stream) {
        return fmt::format("Could not open {:?} for writing: {}", path.string(),
                           std::error_code{errno, std::generic_category()}.message());
    }

    return FileSink{path, std::move(stream)};
}

void FileSink::write(std::string_view str) {
    stream_.write(str.data(), static_cast<std::streamsize>(str.size()));
}

void FileSink::flush() {
    stream_.flush();
}

} // namespace gradebox
