#ifndef LINEDOCS_SOURCE_GZIP_MATERIALIZER_H
#define LINEDOCS_SOURCE_GZIP_MATERIALIZER_H

#include <linedocs/utils/temp_file.h>

#include <cstdint>
#include <cstdio>
#include <string>

namespace linedocs {

/**
 * Decompress all of compressed (gzip) into out, starting at the current
 * position of out.
 * @return number of decompressed bytes written
 * @throws LineDocsError (COMPRESSION_ERROR, FILE_IO_ERROR)
 */
std::uint64_t inflate_to_file(FILE *compressed, FILE *out);

/**
 * Decompress compressed into a new temp file under temp_dir. The returned
 * file is positioned at offset 0 and owned by the caller; on failure the temp
 * file is removed before the exception propagates.
 */
utils::TempFile materialize_gzip(FILE *compressed, const std::string &temp_dir,
                                 std::uint64_t *decompressed_size = nullptr);

}  // namespace linedocs

#endif  // LINEDOCS_SOURCE_GZIP_MATERIALIZER_H
