#include <linedocs/cursor/line_reader.h>
#include <linedocs/line_docs/error.h>

#include <cerrno>
#include <cstring>

namespace linedocs {

LineReader::LineReader(FILE *file, std::size_t buffer_size)
    : file_(file), buffer_(buffer_size), pos_(0), len_(0), eof_(false) {}

bool LineReader::fill() {
    if (eof_) {
        return false;
    }
    std::size_t n = std::fread(buffer_.data(), 1, buffer_.size(), file_);
    if (n == 0) {
        if (std::ferror(file_)) {
            throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                                std::string("Failed to read corpus: ") +
                                    std::strerror(errno));
        }
        eof_ = true;
        return false;
    }
    pos_ = 0;
    len_ = n;
    return true;
}

bool LineReader::read_line(std::string &line) {
    line.clear();
    bool has_data = false;

    while (true) {
        if (pos_ == len_ && !fill()) {
            return has_data;
        }

        const char *data = buffer_.data();
        std::size_t end = pos_;
        while (end < len_ && data[end] != '\n' && data[end] != '\r') {
            ++end;
        }

        if (end > pos_) {
            line.append(data + pos_, end - pos_);
            has_data = true;
        }

        if (end == len_) {
            pos_ = len_;
            continue;
        }

        char terminator = data[end];
        pos_ = end + 1;
        if (terminator == '\r') {
            // "\r\n" counts as a single terminator, even across a refill
            if (pos_ == len_) {
                fill();
            }
            if (pos_ < len_ && buffer_[pos_] == '\n') {
                ++pos_;
            }
        }
        return true;
    }
}

}  // namespace linedocs
