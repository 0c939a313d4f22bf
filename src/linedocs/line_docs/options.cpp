#include <linedocs/common/constants.h>
#include <linedocs/common/file_handle.h>
#include <linedocs/common/logging.h>
#include <linedocs/line_docs/options.h>
#include <linedocs/source/gzip_materializer.h>
#include <linedocs/source/source_resolver.h>

#include <cstdlib>

namespace linedocs {

namespace {
std::string get_env(const char *name) {
    const char *value = std::getenv(name);
    return value ? std::string(value) : std::string();
}
}  // namespace

LineFileDocsOptions LineFileDocsOptions::from_environment() {
    LineFileDocsOptions options;
    options.path = get_env(constants::environment::TEMP_LINE_DOCS_FILE);
    if (options.path.empty()) {
        options.path = get_env(constants::environment::LINE_DOCS_FILE);
    }
    if (options.path.empty()) {
        options.path = constants::corpus::DEFAULT_LINE_DOCS_FILE;
    }
    options.temp_dir = get_env(constants::environment::TEMP_DIR);
    return options;
}

std::string maybe_create_temp_file(const LineFileDocsOptions &options) {
    SourceStream source = open_source(options.path, options.resources.get());
    FileHandle raw(source.file);
    if (!source.compressed) {
        return std::string();
    }

    std::uint64_t size = 0;
    utils::TempFile temp = materialize_gzip(raw.get(), options.temp_dir, &size);
    FileHandle out(temp.file);
    LINEDOCS_LOG_DEBUG("Materialized {} ({} bytes) to {}", options.path, size,
                       temp.path);
    return temp.path;
}

}  // namespace linedocs
