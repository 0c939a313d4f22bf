#ifndef LINEDOCS_SOURCE_SOURCE_RESOLVER_H
#define LINEDOCS_SOURCE_SOURCE_RESOLVER_H

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace linedocs {

class BundledResources;

enum class SourceKind { BUNDLED, EXTERNAL };

/**
 * An opened corpus byte source. The caller owns file and must fclose it.
 */
struct SourceStream {
    SourceKind kind = SourceKind::EXTERNAL;
    FILE *file = nullptr;
    // Size of the bytes behind file (compressed size for a .gz corpus)
    std::uint64_t size = 0;
    bool compressed = false;
    // True only for a plain external file, which is positioned with a real
    // seek before any sizing heuristic applies
    bool direct_seek = false;
};

/**
 * @return true when path carries the compressed-corpus suffix
 */
bool is_compressed_path(const std::string &path);

/**
 * Open path as a bundled resource.
 * @return std::nullopt when resources is null, the identifier is unknown, or
 * the blob cannot be opened as a stream
 */
std::optional<SourceStream> open_bundled(const std::string &path,
                                         const BundledResources *resources);

/**
 * Open path as a filesystem file.
 * @throws LineDocsError (FILE_IO_ERROR) if the file cannot be opened
 */
SourceStream open_external(const std::string &path);

/**
 * Two-step resolution: bundled resource first, filesystem path otherwise.
 * A failed bundled lookup is never an error.
 */
SourceStream open_source(const std::string &path,
                         const BundledResources *resources);

}  // namespace linedocs

#endif  // LINEDOCS_SOURCE_SOURCE_RESOLVER_H
