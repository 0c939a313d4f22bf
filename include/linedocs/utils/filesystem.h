#ifndef LINEDOCS_UTILS_FILESYSTEM_H
#define LINEDOCS_UTILS_FILESYSTEM_H

#include <filesystem>

namespace fs = std::filesystem;

#endif  // LINEDOCS_UTILS_FILESYSTEM_H
