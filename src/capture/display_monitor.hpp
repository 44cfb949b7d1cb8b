#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include <atomic>
#include <functional>
#include <thread>
#include <utility>

namespace vantage::capture {

// Watches DRM connector hotplug through udev and invokes the callback from
// its own thread whenever the set of displays may have changed.
class DisplayMonitor {
 public:
  using Callback = std::function<void()>;

  explicit DisplayMonitor(Callback callback);
  ~DisplayMonitor();

  DisplayMonitor(const DisplayMonitor&) = delete;
  DisplayMonitor& operator=(const DisplayMonitor&) = delete;

 private:
  void run();

  Callback callback_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace vantage::capture
