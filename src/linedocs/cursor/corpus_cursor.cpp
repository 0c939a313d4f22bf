#include <linedocs/common/logging.h>
#include <linedocs/cursor/corpus_cursor.h>
#include <linedocs/line_docs/error.h>

#include <random>
#include <utility>

namespace linedocs {

CorpusCursor::CorpusCursor(CorpusLocation location,
                           std::optional<std::uint64_t> seed,
                           TempFileReaper &reaper)
    : location_(std::move(location)),
      reaper_(reaper),
      next_id_(0),
      rewinds_(0) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_locked(seed);
}

CorpusCursor::~CorpusCursor() { close(); }

void CorpusCursor::open_locked(std::optional<std::uint64_t> seed) {
    handle_.reset();
    if (seed) {
        std::mt19937_64 random(*seed);
        handle_ = CorpusHandle::open(location_, &random, &reaper_);
    } else {
        handle_ = CorpusHandle::open(location_, nullptr, &reaper_);
    }
}

std::string CorpusCursor::next_line() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        throw LineDocsError(LineDocsError::STATE_ERROR,
                            "LineFileDocs is closed");
    }

    std::string line;
    if (handle_->read_line(line)) {
        return line;
    }

    LINEDOCS_LOG_DEBUG("LineFileDocs: now rewind file...");
    rewinds_.fetch_add(1);
    open_locked(std::nullopt);

    if (!handle_->read_line(line)) {
        throw LineDocsError(LineDocsError::FORMAT_ERROR,
                            "corpus " + location_.path + " contains no lines");
    }
    return line;
}

void CorpusCursor::reset(std::optional<std::uint64_t> seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_locked(seed);
    next_id_.store(0);
}

void CorpusCursor::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.reset();
}

bool CorpusCursor::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

}  // namespace linedocs
