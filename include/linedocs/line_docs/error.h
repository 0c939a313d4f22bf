#ifndef LINEDOCS_LINE_DOCS_ERROR_H
#define LINEDOCS_LINE_DOCS_ERROR_H

#include <stdexcept>
#include <string>

namespace linedocs {

class LineDocsError : public std::runtime_error {
   public:
    enum Type {
        FORMAT_ERROR,
        FILE_IO_ERROR,
        COMPRESSION_ERROR,
        INVALID_ARGUMENT,
        STATE_ERROR
    };

    LineDocsError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    static std::string format_message(Type type, const std::string &message);

    Type type_;
};

}  // namespace linedocs

#endif  // LINEDOCS_LINE_DOCS_ERROR_H
