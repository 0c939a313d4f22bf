#include <linedocs/common/logging.h>
#include <linedocs/lifecycle/temp_file_reaper.h>
#include <linedocs/utils/filesystem.h>

#include <system_error>
#include <utility>

namespace linedocs {

bool delete_quietly(const std::string &path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }
    bool removed = fs::remove(path, ec);
    if (ec) {
        LINEDOCS_LOG_DEBUG("Ignoring failure to delete temp file {}: {}", path,
                           ec.message());
        return false;
    }
    if (removed) {
        LINEDOCS_LOG_DEBUG("Deleted temp file {}", path);
    }
    return removed;
}

TempFileReaper::TempFileReaper() : processed_(0) {
    worker_ = std::thread(&TempFileReaper::run, this);
}

TempFileReaper::~TempFileReaper() {
    queue_.push(std::nullopt);
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TempFileReaper::schedule(std::string path) {
    if (path.empty()) {
        return;
    }
    queue_.push(std::move(path));
}

void TempFileReaper::run() {
    while (true) {
        std::optional<std::string> path;
        queue_.wait_and_pop(path);
        if (!path) {
            break;
        }
        delete_quietly(*path);
        processed_.fetch_add(1);
    }
}

}  // namespace linedocs
