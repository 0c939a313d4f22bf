#include <linedocs/line_docs/error.h>
#include <linedocs/utils/filesystem.h>
#include <linedocs/utils/temp_file.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

namespace linedocs::utils {

std::string resolve_temp_dir(const std::string &dir) {
    if (!dir.empty()) {
        return dir;
    }
    std::error_code ec;
    fs::path temp_base = fs::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return temp_base.string();
}

TempFile create_temp_file(const std::string &dir, const std::string &prefix,
                          const std::string &suffix) {
    fs::path base = resolve_temp_dir(dir);
    std::string pattern = (base / (prefix + "XXXXXX" + suffix)).string();

    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                            "Failed to create temp file " + pattern + ": " +
                                std::strerror(errno));
    }

    FILE *file = fdopen(fd, "w+b");
    if (!file) {
        int saved_errno = errno;
        close(fd);
        unlink(name.data());
        throw LineDocsError(LineDocsError::FILE_IO_ERROR,
                            "Failed to open temp file " +
                                std::string(name.data()) + ": " +
                                std::strerror(saved_errno));
    }

    TempFile temp;
    temp.path = name.data();
    temp.file = file;
    return temp;
}

}  // namespace linedocs::utils
