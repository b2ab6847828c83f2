#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>

#include "ThreadSafeQueue.hpp"

/// Concurrency-1 work queue: tasks run one at a time on a single worker, in
/// submission order. A task's exception is delivered through its future and
/// does not affect the tasks queued behind it.
class RequestSerializer {
 public:
  RequestSerializer();
  ~RequestSerializer();

  RequestSerializer(const RequestSerializer&) = delete;
  RequestSerializer& operator=(const RequestSerializer&) = delete;

  template <typename F>
  auto Run(F&& task) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
    std::future<R> result = job->get_future();
    if (!queue_.Push([job] { (*job)(); })) {
      throw std::runtime_error("RequestSerializer: queue is shut down");
    }
    return result;
  }

  /// True when called from the worker, i.e. from inside a task
  bool OnWorker() const {
    return std::this_thread::get_id() == worker_.get_id();
  }

 private:
  void Work();

  ThreadSafeQueue<std::function<void()>> queue_;
  std::thread worker_;
};
