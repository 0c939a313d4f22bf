#ifndef LINEDOCS_COMMON_CONSTANTS_H
#define LINEDOCS_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace linedocs::constants {
namespace corpus {
// Identifier of the corpus shipped with the host as a bundled resource
static constexpr const char *DEFAULT_LINE_DOCS_FILE = "europarl.lines.txt.gz";
static constexpr const char *COMPRESSED_SUFFIX = ".gz";
static constexpr char FIELD_SEPARATOR = '\t';
}  // namespace corpus

namespace sampler {
// Seek offsets are rounded to this width
static constexpr std::int64_t ALIGNMENT_WIDTH = 4;
// Expansion guess for a gzip corpus, only used to size the sampling range
static constexpr double GZIP_EXPANSION_FACTOR = 2.8;
}  // namespace sampler

namespace reader {
static constexpr std::size_t BUFFER_SIZE = 1 << 16;  // 64KB
static constexpr std::size_t ALIGN_CHUNK_SIZE =
    static_cast<std::size_t>(sampler::ALIGNMENT_WIDTH) * 1024;
static constexpr std::size_t FILE_IO_BUFFER_SIZE =
    262144;  // 256KB for file I/O
}  // namespace reader

namespace inflater {
static constexpr int ZLIB_GZIP_WINDOW_BITS = 31;  // 15 + 16 for gzip format
static constexpr std::size_t BUFFER_SIZE = 65536;
}  // namespace inflater

namespace temp_file {
static constexpr const char *PREFIX = "linedocs-";
static constexpr const char *SUFFIX = ".tmp";
}  // namespace temp_file

namespace environment {
static constexpr const char *LINE_DOCS_FILE = "LINEDOCS_FILE";
static constexpr const char *TEMP_LINE_DOCS_FILE = "LINEDOCS_TEMP_FILE";
static constexpr const char *TEMP_DIR = "LINEDOCS_TEMP_DIR";
static constexpr const char *LOG_LEVEL = "LINEDOCS_LOG_LEVEL";
}  // namespace environment
}  // namespace linedocs::constants

#endif  // LINEDOCS_COMMON_CONSTANTS_H
