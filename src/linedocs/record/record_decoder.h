#ifndef LINEDOCS_RECORD_RECORD_DECODER_H
#define LINEDOCS_RECORD_RECORD_DECODER_H

#include <string_view>

namespace linedocs {

// Views into one corpus line, valid while the line is alive
struct LineFields {
    std::string_view title;
    std::string_view date;
    std::string_view body;
};

/**
 * Split "<title>\t<date>\t<body>". Title ends at the first tab, date at the
 * second; the body is everything after it and may itself contain tabs.
 * @throws LineDocsError (FORMAT_ERROR) when either tab is missing
 */
LineFields split_line(std::string_view line);

}  // namespace linedocs

#endif  // LINEDOCS_RECORD_RECORD_DECODER_H
