#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

/// FIFO shared between producers and one or more consumers. After Close(),
/// pushes are refused and Pop() drains what is left, then returns nullopt.
template <typename T>
class ThreadSafeQueue {
 public:
  bool Push(T item) {
    std::unique_lock<std::mutex> lock(mtx);
    if (closed)
      return false;
    q.push(std::move(item));
    cv.notify_one();
    return true;
  }

  std::optional<T> Pop() {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !q.empty() || closed; });
    if (q.empty())
      return std::nullopt;
    T item = std::move(q.front());
    q.pop();
    return item;
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mtx);
    closed = true;
    cv.notify_all();
  }

 private:
  std::queue<T> q;
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool closed{false};
};

#endif  // THREAD_SAFE_QUEUE_HPP
