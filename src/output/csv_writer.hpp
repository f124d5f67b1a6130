#pragma once

#include "output/sink.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace gradebox {

/// Writes RFC 4180 records to a sink
class CsvWriter
{
public:
    explicit CsvWriter(Sink& sink)
        : sink_{&sink} {}

    void write_row(std::initializer_list<std::string_view> fields);

    void flush() { sink_->flush(); }

    /// Quotes ``field`` if it contains a comma, double quote, CR or LF, doubling any double quotes
    static std::string escape(std::string_view field);

private:
    Sink* sink_;
};

} // namespace gradebox
