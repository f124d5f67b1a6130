#include "output/csv_writer.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace gradebox {

void CsvWriter::write_row(std::initializer_list<std::string_view> fields) {
    std::string line;
    bool first = true;

    for (std::string_view field : fields) {
        if (!first) {
            line += ',';
        }
        first = false;

        line += escape(field);
    }

    line += "\r\n";

    sink_->write(line);
}

std::string CsvWriter::escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }

    std::string res;
    res.reserve(field.size() + 2);

    res += '"';
    for (char chr : field) {
        if (chr == '"') {
            res += '"';
        }
        res += chr;
    }
    res += '"';

    return res;
}

} // namespace gradebox
