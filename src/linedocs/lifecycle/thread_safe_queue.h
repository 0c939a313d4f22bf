#ifndef LINEDOCS_LIFECYCLE_THREAD_SAFE_QUEUE_H
#define LINEDOCS_LIFECYCLE_THREAD_SAFE_QUEUE_H

#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>

namespace linedocs {

template <typename T>
class ThreadSafeQueue {
   public:
    ThreadSafeQueue() = default;
    ThreadSafeQueue(const ThreadSafeQueue &) = delete;
    ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

    void push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(value));
        cond_.notify_one();
    }

    void wait_and_pop(T &value) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty(); });
        value = std::move(queue_.front());
        queue_.pop();
    }

   private:
    std::mutex mutex_;
    std::queue<T> queue_;
    std::condition_variable cond_;
};

}  // namespace linedocs

#endif  // LINEDOCS_LIFECYCLE_THREAD_SAFE_QUEUE_H
