#ifndef LINEDOCS_LINE_DOCS_LINE_FILE_DOCS_H
#define LINEDOCS_LINE_DOCS_LINE_FILE_DOCS_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

/**
 * Opaque handle for a line docs reader
 */
typedef void *linedocs_handle_t;

/**
 * One record. Pointers are borrowed: they stay valid until the next
 * linedocs_next() call from the same thread and are not NUL-terminated past
 * their length.
 */
typedef struct {
    uint64_t id;
    const char *title;
    size_t title_length;
    const char *date;
    size_t date_length;
    const char *body;
    size_t body_length;
} linedocs_record_t;

/**
 * Create a reader over a corpus file
 * @param path Corpus path, a ".gz" suffix marks a gzip corpus
 * @param seed Start position seed, negative to read from the start
 * @param use_doc_values Non-zero to populate the titleDV projection
 * @return handle, NULL on error
 */
linedocs_handle_t linedocs_create(const char *path, int64_t seed,
                                  int use_doc_values);

/**
 * Fetch the next record
 * @return 0 on success, -1 on error (malformed line, closed reader, I/O)
 */
int linedocs_next(linedocs_handle_t handle, linedocs_record_t *record);

/**
 * Re-sample the start position and restart ids at 0
 * @param seed Start position seed, negative to read from the start
 * @return 0 on success, -1 on error
 */
int linedocs_reset(linedocs_handle_t handle, int64_t seed);

void linedocs_close(linedocs_handle_t handle);
void linedocs_destroy(linedocs_handle_t handle);
#ifdef __cplusplus
}  // extern "C"

#include <linedocs/document/document.h>
#include <linedocs/line_docs/options.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace linedocs {

struct LineFileDocsImplementor;

/**
 * Endless, thread-safe stream of documents read from a line corpus, where
 * each line is "<title>\t<date>\t<body>".
 *
 * Reading starts at a record boundary sampled from the seed within the first
 * third of the corpus, and wraps to the start of the corpus when the end is
 * reached. Any number of threads may call next_doc() concurrently; every
 * returned document carries a unique, increasing "docid".
 *
 * Example usage:
 * ```cpp
 * linedocs::LineFileDocs docs(42);
 * for (int i = 0; i < 1000; ++i) {
 *     const linedocs::Document &doc = docs.next_doc();
 *     index(doc.get("title"), doc.get("body"));
 * }
 * ```
 */
class LineFileDocs {
   public:
    explicit LineFileDocs(LineFileDocsOptions options);

    // Configured corpus (see LineFileDocsOptions::from_environment)
    explicit LineFileDocs(std::optional<std::uint64_t> seed);
    LineFileDocs(std::optional<std::uint64_t> seed, bool use_doc_values);

    LineFileDocs(const std::string &path, std::optional<std::uint64_t> seed,
                 bool use_doc_values = true);

    ~LineFileDocs();

    // Disable copy constructor and copy assignment
    LineFileDocs(const LineFileDocs &) = delete;
    LineFileDocs &operator=(const LineFileDocs &) = delete;
    LineFileDocs(LineFileDocs &&other) noexcept;
    LineFileDocs &operator=(LineFileDocs &&other) noexcept;

    /**
     * Next document. The document belongs to the calling thread and is
     * overwritten by that thread's next call; copy what must be kept.
     * @throws LineDocsError (FORMAT_ERROR) on a malformed line,
     * (STATE_ERROR) after close()
     */
    const Document &next_doc();

    /**
     * Re-sample the start position from seed and restart ids at 0.
     * Reopens a closed reader.
     */
    void reset(std::optional<std::uint64_t> seed);

    /**
     * Release the corpus and its temp copy. Documents already returned stay
     * readable; per-thread documents are freed on destruction. Safe to call
     * more than once.
     */
    void close();

    bool is_open() const;
    const std::string &get_path() const;
    bool use_doc_values() const;

   private:
    std::unique_ptr<LineFileDocsImplementor> p_impl_;
};

}  // namespace linedocs
#endif

#endif  // LINEDOCS_LINE_DOCS_LINE_FILE_DOCS_H
