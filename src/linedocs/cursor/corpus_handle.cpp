#include <linedocs/common/constants.h>
#include <linedocs/common/file_handle.h>
#include <linedocs/common/logging.h>
#include <linedocs/common/platform_compat.h>
#include <linedocs/cursor/boundary_aligner.h>
#include <linedocs/cursor/corpus_handle.h>
#include <linedocs/lifecycle/temp_file_reaper.h>
#include <linedocs/line_docs/error.h>
#include <linedocs/sampler/position_sampler.h>
#include <linedocs/source/gzip_materializer.h>

#include <utility>

namespace linedocs {

CorpusHandle::CorpusHandle(FILE *file, std::string temp_path, SourceKind kind,
                           TempFileReaper *reaper)
    : file_(file),
      temp_path_(std::move(temp_path)),
      kind_(kind),
      reaper_(reaper),
      start_offset_(0) {
    reader_ = std::make_unique<LineReader>(file_);
}

CorpusHandle::~CorpusHandle() {
    reader_.reset();
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    if (!temp_path_.empty()) {
        if (reaper_) {
            reaper_->schedule(std::move(temp_path_));
        } else {
            delete_quietly(temp_path_);
        }
    }
}

void CorpusHandle::seek(std::uint64_t offset) {
    if (fseeko(file_, static_cast<off_t>(offset), SEEK_SET) == 0) {
        return;
    }
    // Streams that cannot be positioned past their end are parked at EOF, so
    // the first read reports end of stream and triggers a rewind.
    LINEDOCS_LOG_DEBUG("Seek to {} failed, positioning at end of stream",
                       offset);
    if (fseeko(file_, 0, SEEK_END) != 0) {
        throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                            "Failed to seek corpus to offset " +
                                std::to_string(offset));
    }
}

std::unique_ptr<CorpusHandle> CorpusHandle::open(const CorpusLocation &location,
                                                 std::mt19937_64 *random,
                                                 TempFileReaper *reaper) {
    SourceStream source = open_source(location.path, location.resources.get());
    FileHandle raw(source.file);

    std::uint64_t size = source.size;
    std::uint64_t seek_to = 0;
    bool need_skip = true;

    if (source.direct_seek) {
        // plain file: sample against its real size
        seek_to = sample_seek_position(random, size);
        LINEDOCS_LOG_DEBUG("LineFileDocs: file seek to fp={} on open", seek_to);
        need_skip = false;
    }

    std::string temp_path;
    if (source.compressed) {
        // a gzip stream cannot seek, decompress into a random-access file
        utils::TempFile temp = materialize_gzip(raw.get(), location.temp_dir);
        raw.reset(temp.file);
        temp_path = std::move(temp.path);
        size = static_cast<std::uint64_t>(
            static_cast<double>(size) *
            constants::sampler::GZIP_EXPANSION_FACTOR);
    }

    std::unique_ptr<CorpusHandle> handle(new CorpusHandle(
        raw.release(), std::move(temp_path), source.kind, reaper));

    if (need_skip) {
        seek_to = sample_seek_position(random, size);
        LINEDOCS_LOG_DEBUG("LineFileDocs: stream skip to fp={} on open",
                           seek_to);
    }
    handle->seek(seek_to);
    handle->start_offset_ = seek_to;

    if (seek_to > 0) {
        seek_to_next_line_break_or_end(handle->file_);
        // drop the rest of the line we landed in, including both bytes of a
        // "\r\n"
        std::string discarded;
        handle->read_line(discarded);
    }

    return handle;
}

}  // namespace linedocs
