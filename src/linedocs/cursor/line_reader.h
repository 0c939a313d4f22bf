#ifndef LINEDOCS_CURSOR_LINE_READER_H
#define LINEDOCS_CURSOR_LINE_READER_H

#include <linedocs/common/constants.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace linedocs {

/**
 * Buffered text line reader over a FILE *. Lines end at "\n", "\r" or
 * "\r\n"; the terminator is not part of the returned line. Bytes are passed
 * through untouched (UTF-8 in, UTF-8 out, no byte-order-mark handling).
 *
 * The reader does not own file. Position file before the first read_line();
 * it must not be repositioned afterwards.
 */
class LineReader {
   public:
    explicit LineReader(FILE *file,
                        std::size_t buffer_size = constants::reader::BUFFER_SIZE);

    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;

    /**
     * Read the next line into line.
     * @return false at end of stream, line is then empty
     * @throws LineDocsError (FILE_IO_ERROR) on a read error
     */
    bool read_line(std::string &line);

   private:
    bool fill();

    FILE *file_;
    std::vector<char> buffer_;
    std::size_t pos_;
    std::size_t len_;
    bool eof_;
};

}  // namespace linedocs

#endif  // LINEDOCS_CURSOR_LINE_READER_H
