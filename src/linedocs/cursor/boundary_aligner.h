#ifndef LINEDOCS_CURSOR_BOUNDARY_ALIGNER_H
#define LINEDOCS_CURSOR_BOUNDARY_ALIGNER_H

#include <cstdio>

namespace linedocs {

/**
 * Scan forward from the current position of file, in chunks of
 * constants::reader::ALIGN_CHUNK_SIZE bytes, for the next '\r' or '\n' and
 * leave file positioned on that byte. Reading one line afterwards consumes
 * the terminator (both bytes of a "\r\n"), so the line after it is whole.
 *
 * @return false when no terminator exists before end of stream; file is
 * then left at EOF
 * @throws LineDocsError (FILE_IO_ERROR) on a read or seek error
 */
bool seek_to_next_line_break_or_end(FILE *file);

}  // namespace linedocs

#endif  // LINEDOCS_CURSOR_BOUNDARY_ALIGNER_H
