#ifndef UTIL_BLOCKING_QUEUE_HPP
#define UTIL_BLOCKING_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <queue>

namespace util {

// A FIFO queue shared between producer and consumer threads. Once stopped,
// Dequeue drains the remaining elements and then returns false.
template <typename T>
class BlockingQueue {
 public:
  void Enqueue(T&& element) {
    std::unique_lock<std::mutex> lck(queue_mutex_);
    queue_.push(std::move(element));
    queue_cv_.notify_one();
  }

  // Blocks until an element is available or the queue is stopped.
  bool Dequeue(T* out) {
    std::unique_lock<std::mutex> lck(queue_mutex_);
    while (!stopped_ && queue_.empty()) {
      queue_cv_.wait(lck);
    }
    if (queue_.empty()) return false;
    *out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void Stop() {
    std::unique_lock<std::mutex> lck(queue_mutex_);
    stopped_ = true;
    queue_cv_.notify_all();
  }

  size_t Size() {
    std::unique_lock<std::mutex> lck(queue_mutex_);
    return queue_.size();
  }

 private:
  std::queue<T> queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  bool stopped_ = false;
};

}  // namespace util

#endif
