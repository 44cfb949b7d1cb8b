#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "audio/audio_sample_source.hpp"
#include "capture/capture_backend.hpp"
#include "capture/picker_coordinator.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vantage::test {

class FakeBackend : public capture::CaptureBackend {
 public:
  capture::Status begin(const capture::SessionSettings& settings) override {
    std::shared_future<void> gate;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++begin_calls_;
      calls_.push_back("begin");
      sessions_.push_back(settings);
      gate = gate_;
    }
    entered_.set_value_once();
    if (gate.valid()) {
      gate.wait();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_next_) {
      fail_next_ = false;
      return capture::Status::error(capture::SessionErrc::BackendError,
                                    "device busy");
    }
    active_ = true;
    return capture::Status::ok();
  }

  void end() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++end_calls_;
    calls_.push_back("end");
    active_ = false;
  }

  // begin() blocks until release() is called.
  void hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    gate_ = release_.get_future().share();
  }
  void release() { release_.set_value(); }
  void wait_entered() { entered_.future.wait(); }

  void fail_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = true;
  }

  int begin_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return begin_calls_;
  }
  int end_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_calls_;
  }
  bool active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
  }
  std::vector<capture::SessionSettings> sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_;
  }
  // "begin" and "end" in the order the backend saw them.
  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

 private:
  struct OnceSignal {
    std::promise<void> promise;
    std::shared_future<void> future{promise.get_future().share()};
    std::atomic<bool> fired{false};
    void set_value_once() {
      if (!fired.exchange(true)) {
        promise.set_value();
      }
    }
  };

  mutable std::mutex mutex_;
  int begin_calls_{0};
  int end_calls_{0};
  bool active_{false};
  bool fail_next_{false};
  std::vector<capture::SessionSettings> sessions_;
  std::vector<std::string> calls_;
  std::promise<void> release_;
  std::shared_future<void> gate_;
  OnceSignal entered_;
};

class FakeAudioSource : public audio::AudioSampleSource {
 public:
  bool play() override {
    playing_ = true;
    ++play_calls;
    return true;
  }
  void stop() override {
    playing_ = false;
    ++stop_calls;
  }
  bool is_playing() const noexcept override { return playing_; }
  float level() const noexcept override { return playing_ ? 0.5f : 0.0f; }

  int play_calls{0};
  int stop_calls{0};

 private:
  bool playing_{false};
};

class FakePicker : public capture::PickerCoordinator {
 public:
  void present() override { ++present_calls; }
  void set_active(bool value) override { active = value; }

  int present_calls{0};
  std::optional<bool> active;
};

inline capture::DisplayDescriptor display(uint32_t id) {
  capture::DisplayDescriptor d;
  d.id = id;
  d.name = "DP-" + std::to_string(id);
  d.width = 2560;
  d.height = 1440;
  return d;
}

inline capture::WindowDescriptor window(uint32_t id, std::string title) {
  capture::WindowDescriptor w;
  w.id = id;
  w.title = std::move(title);
  w.application = "Terminal";
  return w;
}

}  // namespace vantage::test
