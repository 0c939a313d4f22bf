#ifndef LINEDOCS_RECORD_DOC_STATE_H
#define LINEDOCS_RECORD_DOC_STATE_H

#include <linedocs/document/document.h>
#include <linedocs/record/record_decoder.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace linedocs {

/**
 * Reusable record buffer owned by a single thread. The document and its
 * fields are created once; assign() only overwrites values.
 */
class DocState {
   public:
    explicit DocState(bool use_doc_values);

    DocState(const DocState &) = delete;
    DocState &operator=(const DocState &) = delete;

    void assign(const LineFields &fields, std::uint64_t id);

    const Document &document() const { return doc_; }
    std::uint64_t id() const { return id_; }

   private:
    Document doc_;
    Field *title_;
    Field *title_tokenized_;
    Field *body_;
    Field *id_field_;
    Field *date_;
    Field *title_dv_;
    std::uint64_t id_;
};

/**
 * One DocState per thread, created on first use.
 *
 * The map is locked only the first time a thread asks this pool for its
 * state; later calls hit a thread_local cache. Entries are not pruned when a
 * thread exits: the pool holds one DocState per distinct thread id it has
 * served until clear() or destruction.
 */
class RecordBufferPool {
   public:
    explicit RecordBufferPool(bool use_doc_values);

    DocState &local();

    // Frees every thread's state; no thread may be inside local() or hold a
    // document from this pool.
    void clear();
    std::size_t size() const;

   private:
    DocState &lookup();

    bool use_doc_values_;
    // Unique across pools and bumped by clear(), invalidates thread caches
    std::atomic<std::uint64_t> generation_;
    mutable std::mutex mutex_;
    std::unordered_map<std::thread::id, std::unique_ptr<DocState>> states_;
};

}  // namespace linedocs

#endif  // LINEDOCS_RECORD_DOC_STATE_H
