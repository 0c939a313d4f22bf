#ifndef LINEDOCS_LINE_DOCS_OPTIONS_H
#define LINEDOCS_LINE_DOCS_OPTIONS_H

#include <linedocs/source/bundled_resources.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace linedocs {

struct LineFileDocsOptions {
    // Start position seed, none means read from offset 0
    std::optional<std::uint64_t> seed;
    // Filesystem path or bundled resource identifier
    std::string path;
    // Populate the sorted "titleDV" projection
    bool use_doc_values = true;
    // Where decompressed copies go, empty for the system temp directory
    std::string temp_dir;
    std::shared_ptr<const BundledResources> resources;

    /**
     * Options for the configured corpus: LINEDOCS_TEMP_FILE, then
     * LINEDOCS_FILE, then the bundled default corpus. LINEDOCS_TEMP_DIR sets
     * temp_dir.
     */
    static LineFileDocsOptions from_environment();
};

/**
 * Decompress the configured corpus once so that many readers can share a
 * seekable copy.
 * @return path of the decompressed file, owned and deleted by the caller,
 * or an empty string when the corpus is not compressed
 * @throws LineDocsError if the corpus cannot be opened or decompressed
 */
std::string maybe_create_temp_file(const LineFileDocsOptions &options);

}  // namespace linedocs

#endif  // LINEDOCS_LINE_DOCS_OPTIONS_H
