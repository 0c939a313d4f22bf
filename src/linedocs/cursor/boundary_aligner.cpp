#include <linedocs/common/constants.h>
#include <linedocs/common/platform_compat.h>
#include <linedocs/cursor/boundary_aligner.h>
#include <linedocs/line_docs/error.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace linedocs {

bool seek_to_next_line_break_or_end(FILE *file) {
    std::vector<unsigned char> chunk(constants::reader::ALIGN_CHUNK_SIZE);

    while (true) {
        std::size_t read = std::fread(chunk.data(), 1, chunk.size(), file);
        if (read == 0) {
            if (std::ferror(file)) {
                throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                                    std::string("Failed to scan corpus: ") +
                                        std::strerror(errno));
            }
            return false;
        }

        for (std::size_t i = 0; i < read; ++i) {
            if (chunk[i] == '\r' || chunk[i] == '\n') {
                // move back from the end of the chunk onto the line break
                off_t back = -static_cast<off_t>(read - i);
                if (fseeko(file, back, SEEK_CUR) != 0) {
                    throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                                        std::string("Failed to seek corpus: ") +
                                            std::strerror(errno));
                }
                return true;
            }
        }
    }
}

}  // namespace linedocs
