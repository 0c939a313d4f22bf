#include <linedocs/common/constants.h>
#include <linedocs/common/logging.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/source/bundled_resources.h>
#include <linedocs/source/source_resolver.h>
#include <linedocs/utils/filesystem.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace linedocs {

bool is_compressed_path(const std::string &path) {
    const std::string suffix = constants::corpus::COMPRESSED_SUFFIX;
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) ==
               0;
}

std::optional<SourceStream> open_bundled(const std::string &path,
                                         const BundledResources *resources) {
    if (resources == nullptr) {
        return std::nullopt;
    }
    const std::string *bytes = resources->find(path);
    if (bytes == nullptr || bytes->empty()) {
        return std::nullopt;
    }

    // fmemopen never writes through a "rb" stream
    FILE *file = fmemopen(const_cast<char *>(bytes->data()), bytes->size(),
                          "rb");
    if (!file) {
        LINEDOCS_LOG_DEBUG("Cannot open bundled resource {}: {}", path,
                           std::strerror(errno));
        return std::nullopt;
    }

    SourceStream source;
    source.kind = SourceKind::BUNDLED;
    source.file = file;
    source.size = bytes->size();
    source.compressed = is_compressed_path(path);
    source.direct_seek = false;
    return source;
}

SourceStream open_external(const std::string &path) {
    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                            "Cannot stat corpus file " + path + ": " +
                                ec.message());
    }

    FILE *file = fopen(path.c_str(), "rb");
    if (!file) {
        throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                            "Failed to open file: " + path);
    }

    SourceStream source;
    source.kind = SourceKind::EXTERNAL;
    source.file = file;
    source.size = static_cast<std::uint64_t>(size);
    source.compressed = is_compressed_path(path);
    source.direct_seek = !source.compressed;
    if (source.direct_seek) {
        setvbuf(file, nullptr, _IOFBF, constants::reader::FILE_IO_BUFFER_SIZE);
    }
    return source;
}

SourceStream open_source(const std::string &path,
                         const BundledResources *resources) {
    if (auto bundled = open_bundled(path, resources)) {
        LINEDOCS_LOG_DEBUG("Resolved {} as a bundled resource ({} bytes)", path,
                           bundled->size);
        return *bundled;
    }
    return open_external(path);
}

}  // namespace linedocs
