#include <linedocs/line_docs/error.h>

namespace linedocs {

std::string LineDocsError::format_message(Type type,
                                          const std::string &message) {
    std::string prefix;
    switch (type) {
        case FORMAT_ERROR:
            prefix = "[FORMAT]";
            break;
        case FILE_IO_ERROR:
            prefix = "[FILE_IO]";
            break;
        case COMPRESSION_ERROR:
            prefix = "[COMPRESSION]";
            break;
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case STATE_ERROR:
            prefix = "[STATE]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace linedocs
