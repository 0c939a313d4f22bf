#ifndef LINEDOCS_UTILS_TEMP_FILE_H
#define LINEDOCS_UTILS_TEMP_FILE_H

#include <cstdio>
#include <string>

namespace linedocs::utils {

/**
 * A freshly created, uniquely named temp file opened for read/write.
 * The caller owns file and must fclose it.
 */
struct TempFile {
    std::string path;
    FILE *file = nullptr;
};

/**
 * Create a unique temp file "<dir>/<prefix>XXXXXX<suffix>".
 * @param dir Directory to create the file in, empty for the system temp dir
 * @throws LineDocsError (FILE_IO_ERROR) if the file cannot be created
 */
TempFile create_temp_file(const std::string &dir, const std::string &prefix,
                          const std::string &suffix);

/**
 * Resolve the directory temp artifacts are created in
 */
std::string resolve_temp_dir(const std::string &dir);

}  // namespace linedocs::utils

#endif  // LINEDOCS_UTILS_TEMP_FILE_H
