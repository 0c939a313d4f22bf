#include <linedocs/common/logging.h>
#include <linedocs/line_docs/line_file_docs.h>
#include <linedocs/line_docs/line_file_docs_impl.h>

#include <exception>
#include <string>
#include <utility>

namespace linedocs {

namespace {
LineFileDocsOptions environment_options(std::optional<std::uint64_t> seed,
                                        bool use_doc_values) {
    LineFileDocsOptions options = LineFileDocsOptions::from_environment();
    options.seed = seed;
    options.use_doc_values = use_doc_values;
    return options;
}

LineFileDocsOptions path_options(const std::string &path,
                                 std::optional<std::uint64_t> seed,
                                 bool use_doc_values) {
    LineFileDocsOptions options;
    options.path = path;
    options.seed = seed;
    options.use_doc_values = use_doc_values;
    return options;
}
}  // namespace

LineFileDocs::LineFileDocs(LineFileDocsOptions options)
    : p_impl_(new LineFileDocsImplementor(options)) {}

LineFileDocs::LineFileDocs(std::optional<std::uint64_t> seed)
    : LineFileDocs(environment_options(seed, true)) {}

LineFileDocs::LineFileDocs(std::optional<std::uint64_t> seed,
                           bool use_doc_values)
    : LineFileDocs(environment_options(seed, use_doc_values)) {}

LineFileDocs::LineFileDocs(const std::string &path,
                           std::optional<std::uint64_t> seed,
                           bool use_doc_values)
    : LineFileDocs(path_options(path, seed, use_doc_values)) {}

LineFileDocs::~LineFileDocs() = default;

LineFileDocs::LineFileDocs(LineFileDocs &&other) noexcept
    : p_impl_(other.p_impl_.release()) {}

LineFileDocs &LineFileDocs::operator=(LineFileDocs &&other) noexcept {
    if (this != &other) {
        p_impl_.reset(other.p_impl_.release());
    }
    return *this;
}

const Document &LineFileDocs::next_doc() { return p_impl_->next_doc(); }

void LineFileDocs::reset(std::optional<std::uint64_t> seed) {
    p_impl_->reset(seed);
}

void LineFileDocs::close() { p_impl_->close(); }

bool LineFileDocs::is_open() const { return p_impl_ && p_impl_->is_open(); }

const std::string &LineFileDocs::get_path() const { return p_impl_->path; }

bool LineFileDocs::use_doc_values() const { return p_impl_->use_doc_values; }

}  // namespace linedocs

// ==============================================================================
// C API Implementation
// ==============================================================================

namespace {
std::optional<std::uint64_t> seed_from_c(int64_t seed) {
    if (seed < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(seed);
}

int validate_handle(linedocs_handle_t handle) { return handle ? 0 : -1; }

linedocs::LineFileDocs *cast_docs(linedocs_handle_t handle) {
    return static_cast<linedocs::LineFileDocs *>(handle);
}
}  // namespace

extern "C" {

linedocs_handle_t linedocs_create(const char *path, int64_t seed,
                                  int use_doc_values) {
    if (!path) {
        LINEDOCS_LOG_ERROR("Corpus path cannot be null");
        return nullptr;
    }

    try {
        auto *docs = new linedocs::LineFileDocs(path, seed_from_c(seed),
                                                use_doc_values != 0);
        return static_cast<linedocs_handle_t>(docs);
    } catch (const std::exception &e) {
        LINEDOCS_LOG_ERROR("Failed to create line docs reader: {}", e.what());
        return nullptr;
    }
}

int linedocs_next(linedocs_handle_t handle, linedocs_record_t *record) {
    if (validate_handle(handle) || !record) {
        return -1;
    }

    try {
        const linedocs::Document &doc = cast_docs(handle)->next_doc();
        const linedocs::Field *id = doc.get_field("docid");
        const linedocs::Field *title = doc.get_field("titleTokenized");
        const linedocs::Field *date = doc.get_field("date");
        const linedocs::Field *body = doc.get_field("body");

        record->id = std::stoull(id->value());
        record->title = title->value().data();
        record->title_length = title->value().size();
        record->date = date->value().data();
        record->date_length = date->value().size();
        record->body = body->value().data();
        record->body_length = body->value().size();
        return 0;
    } catch (const std::exception &e) {
        LINEDOCS_LOG_ERROR("Failed to read next record: {}", e.what());
        return -1;
    }
}

int linedocs_reset(linedocs_handle_t handle, int64_t seed) {
    if (validate_handle(handle)) {
        return -1;
    }

    try {
        cast_docs(handle)->reset(seed_from_c(seed));
        return 0;
    } catch (const std::exception &e) {
        LINEDOCS_LOG_ERROR("Failed to reset line docs reader: {}", e.what());
        return -1;
    }
}

void linedocs_close(linedocs_handle_t handle) {
    if (handle) {
        cast_docs(handle)->close();
    }
}

void linedocs_destroy(linedocs_handle_t handle) {
    if (handle) {
        delete cast_docs(handle);
    }
}

}  // extern "C"
