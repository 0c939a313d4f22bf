#include <linedocs/common/constants.h>
#include <linedocs/common/inflater.h>
#include <linedocs/common/logging.h>
#include <linedocs/common/platform_compat.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/source/gzip_materializer.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <vector>

namespace linedocs {

std::uint64_t inflate_to_file(FILE *compressed, FILE *out) {
    auto inflater = std::make_unique<Inflater>();
    if (!inflater->initialize(compressed)) {
        throw LineDocsError(LineDocsError::COMPRESSION_ERROR,
                            "Failed to initialize inflater");
    }

    std::vector<unsigned char> buffer(constants::inflater::BUFFER_SIZE);
    std::uint64_t total = 0;
    while (true) {
        std::size_t bytes_read = 0;
        if (!inflater->read(compressed, buffer.data(), buffer.size(),
                            bytes_read)) {
            throw LineDocsError(
                LineDocsError::COMPRESSION_ERROR,
                "Corrupt gzip stream after " + std::to_string(total) +
                    " decompressed bytes");
        }
        if (bytes_read == 0) {
            break;
        }
        if (std::fwrite(buffer.data(), 1, bytes_read, out) != bytes_read) {
            throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                                std::string("Failed to write temp file: ") +
                                    std::strerror(errno));
        }
        total += bytes_read;
    }

    if (std::fflush(out) != 0) {
        throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                            std::string("Failed to flush temp file: ") +
                                std::strerror(errno));
    }
    return total;
}

utils::TempFile materialize_gzip(FILE *compressed, const std::string &temp_dir,
                                 std::uint64_t *decompressed_size) {
    utils::TempFile temp = utils::create_temp_file(
        temp_dir, constants::temp_file::PREFIX, constants::temp_file::SUFFIX);
    try {
        std::uint64_t written = inflate_to_file(compressed, temp.file);
        if (fseeko(temp.file, 0, SEEK_SET) != 0) {
            throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                                "Failed to rewind temp file " + temp.path);
        }
        LINEDOCS_LOG_DEBUG("Decompressed {} bytes into {}", written, temp.path);
        if (decompressed_size) {
            *decompressed_size = written;
        }
    } catch (const LineDocsError &) {
        std::fclose(temp.file);
        std::remove(temp.path.c_str());
        throw;
    }
    return temp;
}

}  // namespace linedocs
