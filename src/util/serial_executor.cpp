#include "util/serial_executor.hpp"

#include "vantage/log.hpp"

namespace vantage::util {

SerialExecutor::SerialExecutor() {
  worker_ = std::thread([this]() { worker_loop(); });
}

SerialExecutor::~SerialExecutor() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void SerialExecutor::wait_idle() {
  if (on_worker_thread()) {
    vantage::log::warn("SerialExecutor: wait_idle called from worker thread");
    return;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return tasks_.empty() && !busy_; });
}

std::size_t SerialExecutor::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size() + (busy_ ? 1 : 0);
}

void SerialExecutor::worker_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (stopping_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
      busy_ = true;
    }
    try {
      task();
    } catch (const std::exception& ex) {
      vantage::log::warn("SerialExecutor task raised exception:", ex.what());
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace vantage::util
