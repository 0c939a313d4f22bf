#ifndef LINEDOCS_CURSOR_CORPUS_CURSOR_H
#define LINEDOCS_CURSOR_CORPUS_CURSOR_H

#include <linedocs/cursor/corpus_handle.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace linedocs {

class TempFileReaper;

/**
 * Shared read position over a corpus.
 *
 * All line fetches are serialized on one mutex. When the handle runs out of
 * lines it is closed and reopened at offset 0, so callers see an endless
 * stream. The record counter only goes back to 0 on reset().
 */
class CorpusCursor {
   public:
    CorpusCursor(CorpusLocation location, std::optional<std::uint64_t> seed,
                 TempFileReaper &reaper);
    ~CorpusCursor();

    CorpusCursor(const CorpusCursor &) = delete;
    CorpusCursor &operator=(const CorpusCursor &) = delete;

    /**
     * Read the next line, rewinding to the start of the corpus on EOF.
     * @throws LineDocsError (STATE_ERROR) when closed, (FORMAT_ERROR) when the
     * corpus holds no line at all, or whatever reopening the corpus throws
     */
    std::string next_line();

    // Take the next record id
    std::uint64_t take_id() { return next_id_.fetch_add(1); }

    /**
     * Reopen at a position sampled from seed (offset 0 without one) and
     * restart ids at 0. Also reopens a closed cursor.
     */
    void reset(std::optional<std::uint64_t> seed);

    void close();
    bool is_open() const;

    std::size_t rewind_count() const { return rewinds_.load(); }

   private:
    void open_locked(std::optional<std::uint64_t> seed);

    CorpusLocation location_;
    TempFileReaper &reaper_;
    mutable std::mutex mutex_;
    std::unique_ptr<CorpusHandle> handle_;
    std::atomic<std::uint64_t> next_id_;
    std::atomic<std::size_t> rewinds_;
};

}  // namespace linedocs

#endif  // LINEDOCS_CURSOR_CORPUS_CURSOR_H
