#ifndef LINEDOCS_LIFECYCLE_TEMP_FILE_REAPER_H
#define LINEDOCS_LIFECYCLE_TEMP_FILE_REAPER_H

#include <linedocs/lifecycle/thread_safe_queue.h>

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>

namespace linedocs {

/**
 * Deletes temp artifacts on a background worker thread.
 *
 * schedule() returns immediately; the file may still exist for a short while
 * afterwards. Deletion is best effort: a missing file is skipped and a failed
 * delete is logged at debug level and dropped, never reported or retried.
 * The destructor drains the pending paths and joins the worker.
 */
class TempFileReaper {
   public:
    TempFileReaper();
    ~TempFileReaper();

    TempFileReaper(const TempFileReaper &) = delete;
    TempFileReaper &operator=(const TempFileReaper &) = delete;

    void schedule(std::string path);

    // Number of paths processed so far, deleted or not
    std::size_t processed_count() const { return processed_.load(); }

   private:
    void run();

    // std::nullopt stops the worker
    ThreadSafeQueue<std::optional<std::string>> queue_;
    std::atomic<std::size_t> processed_;
    std::thread worker_;
};

/**
 * Remove path if it exists, ignoring any failure.
 * @return true if the file was removed
 */
bool delete_quietly(const std::string &path);

}  // namespace linedocs

#endif  // LINEDOCS_LIFECYCLE_TEMP_FILE_REAPER_H
