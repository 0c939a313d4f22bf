#include <linedocs/common/logging.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/line_docs/line_file_docs_impl.h>
#include <linedocs/record/record_decoder.h>

namespace linedocs {

namespace {
CorpusLocation make_location(const LineFileDocsOptions &options) {
    if (options.path.empty()) {
        throw LineDocsError(LineDocsError::INVALID_ARGUMENT,
                            "corpus path cannot be empty");
    }
    CorpusLocation location;
    location.path = options.path;
    location.temp_dir = options.temp_dir;
    location.resources = options.resources;
    return location;
}
}  // namespace

LineFileDocsImplementor::LineFileDocsImplementor(
    const LineFileDocsOptions &options)
    : path(options.path),
      use_doc_values(options.use_doc_values),
      cursor(make_location(options), options.seed, reaper),
      buffers(options.use_doc_values) {
    LINEDOCS_LOG_DEBUG("Opened line docs {} (doc values: {})", path,
                       use_doc_values);
}

LineFileDocsImplementor::~LineFileDocsImplementor() {
    cursor.close();
    buffers.clear();
}

const Document &LineFileDocsImplementor::next_doc() {
    const std::string line = cursor.next_line();

    // decoded outside the cursor lock; a malformed line takes no id
    LineFields fields = split_line(line);
    DocState &state = buffers.local();
    state.assign(fields, cursor.take_id());
    return state.document();
}

void LineFileDocsImplementor::reset(std::optional<std::uint64_t> seed) {
    cursor.reset(seed);
}

// Per-thread documents stay alive until destruction; other threads may still
// hold the last one they were handed.
void LineFileDocsImplementor::close() { cursor.close(); }

}  // namespace linedocs
