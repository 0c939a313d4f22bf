#ifndef LINEDOCS_CURSOR_CORPUS_HANDLE_H
#define LINEDOCS_CURSOR_CORPUS_HANDLE_H

#include <linedocs/cursor/line_reader.h>
#include <linedocs/source/source_resolver.h>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <random>
#include <string>

namespace linedocs {

class BundledResources;
class TempFileReaper;

// Where a corpus lives and where its temp artifacts go
struct CorpusLocation {
    std::string path;
    std::string temp_dir;
    std::shared_ptr<const BundledResources> resources;
};

/**
 * The open corpus: a positioned byte source, the line reader on top of it,
 * and the temp artifact backing it when the corpus was compressed.
 */
class CorpusHandle {
   public:
    CorpusHandle(FILE *file, std::string temp_path, SourceKind kind,
                 TempFileReaper *reaper);
    ~CorpusHandle();

    CorpusHandle(const CorpusHandle &) = delete;
    CorpusHandle &operator=(const CorpusHandle &) = delete;

    /**
     * Open location and position it at a sampled, record-aligned offset.
     * @param random Seed source, nullptr opens at offset 0
     * @throws LineDocsError if the corpus cannot be opened or decompressed
     */
    static std::unique_ptr<CorpusHandle> open(const CorpusLocation &location,
                                              std::mt19937_64 *random,
                                              TempFileReaper *reaper);

    bool read_line(std::string &line) { return reader_->read_line(line); }

    SourceKind kind() const { return kind_; }
    const std::string &temp_path() const { return temp_path_; }
    std::uint64_t start_offset() const { return start_offset_; }

   private:
    void seek(std::uint64_t offset);

    FILE *file_;
    std::unique_ptr<LineReader> reader_;
    std::string temp_path_;
    SourceKind kind_;
    TempFileReaper *reaper_;
    std::uint64_t start_offset_;
};

}  // namespace linedocs

#endif  // LINEDOCS_CURSOR_CORPUS_HANDLE_H
