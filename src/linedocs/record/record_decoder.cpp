#include <linedocs/common/constants.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/record/record_decoder.h>

#include <string>

namespace linedocs {

namespace {
[[noreturn]] void throw_invalid_line(std::string_view line) {
    throw LineDocsError(LineDocsError::FORMAT_ERROR,
                        "line: [" + std::string(line) +
                            "] is in an invalid format !");
}
}  // namespace

LineFields split_line(std::string_view line) {
    const auto first = line.find(constants::corpus::FIELD_SEPARATOR);
    if (first == std::string_view::npos) {
        throw_invalid_line(line);
    }
    const auto second =
        line.find(constants::corpus::FIELD_SEPARATOR, first + 1);
    if (second == std::string_view::npos) {
        throw_invalid_line(line);
    }

    LineFields fields;
    fields.title = line.substr(0, first);
    fields.date = line.substr(first + 1, second - first - 1);
    fields.body = line.substr(second + 1);
    return fields;
}

}  // namespace linedocs
