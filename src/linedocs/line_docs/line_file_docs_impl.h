#ifndef LINEDOCS_LINE_DOCS_LINE_FILE_DOCS_IMPL_H
#define LINEDOCS_LINE_DOCS_LINE_FILE_DOCS_IMPL_H

#include <linedocs/cursor/corpus_cursor.h>
#include <linedocs/document/document.h>
#include <linedocs/lifecycle/temp_file_reaper.h>
#include <linedocs/line_docs/options.h>
#include <linedocs/record/doc_state.h>

#include <cstdint>
#include <optional>
#include <string>

namespace linedocs {

struct LineFileDocsImplementor {
    std::string path;
    bool use_doc_values;

    explicit LineFileDocsImplementor(const LineFileDocsOptions &options);
    ~LineFileDocsImplementor();

    const Document &next_doc();
    void reset(std::optional<std::uint64_t> seed);
    void close();
    inline bool is_open() const { return cursor.is_open(); }

   private:
    // Declared first so it outlives the cursor and drains its last deletes
    TempFileReaper reaper;
    CorpusCursor cursor;
    RecordBufferPool buffers;
};

}  // namespace linedocs

#endif  // LINEDOCS_LINE_DOCS_LINE_FILE_DOCS_IMPL_H
