#ifndef LINEDOCS_COMMON_FILE_HANDLE_H
#define LINEDOCS_COMMON_FILE_HANDLE_H

#include <cstdio>
#include <memory>

namespace linedocs {

struct FileCloser {
    void operator()(FILE *file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

using FileHandle = std::unique_ptr<FILE, FileCloser>;

}  // namespace linedocs

#endif  // LINEDOCS_COMMON_FILE_HANDLE_H
