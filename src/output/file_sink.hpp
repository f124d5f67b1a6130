#pragma once

#include "output/sink.hpp"

#include <gradebox/common/expected.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace gradebox {

/// Writes to a file, truncating it when opened
class FileSink : public Sink
{
public:
    /// On failure, returns a description of why the file could not be opened
    static Expected<FileSink, std::string> open(const std::filesystem::path& path);

    void write(std::string_view str) override;
    void flush() override;

    const std::filesystem::path& get_path() const { return path_; }

private:
    FileSink(std::filesystem::path path, std::ofstream stream);

    std::filesystem::path path_;
    std::ofstream stream_;
};

/// Collects everything written in memory
class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }
    void flush() override {}

    const std::string& get_str() const { return buffer_; }

private:
    std::string buffer_;
};

} // namespace gradebox
