#include "RequestSerializer.hpp"
#include "Logger.hpp"

RequestSerializer::RequestSerializer() : worker_{[this] { Work(); }} {
}

RequestSerializer::~RequestSerializer() {
  // queued tasks still run so no caller is left with a broken promise
  queue_.Close();
  if (worker_.joinable())
    worker_.join();
}

void RequestSerializer::Work() {
  while (auto task = queue_.Pop()) {
    // packaged_task stores the task's exception in its future
    (*task)();
  }
  logr::debug << "[RequestSerializer] worker stopped";
}
