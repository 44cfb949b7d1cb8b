#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

namespace vantage::util {

// Runs posted tasks one at a time, in posting order, on a single worker
// thread. Tasks still queued at destruction are run before the worker exits.
class SerialExecutor {
 public:
  SerialExecutor();
  ~SerialExecutor();

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;

  template <typename Func>
  auto post(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using ReturnType = std::invoke_result_t<Func>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<Func>(func));

    std::future<ReturnType> result = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_all();
    return result;
  }

  // Blocks until every task posted so far has finished.
  void wait_idle();

  std::size_t pending() const;

  bool on_worker_thread() const noexcept {
    return std::this_thread::get_id() == worker_.get_id();
  }

 private:
  void worker_loop();

  std::thread worker_;
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool busy_{false};
  bool stopping_{false};
};

}  // namespace vantage::util
