#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "audio/audio_sample_source.hpp"
#include "capture/capture_backend.hpp"
#include "capture/capture_configuration.hpp"
#include "capture/picker_coordinator.hpp"
#include "capture/session_status.hpp"
#include "util/serial_executor.hpp"
#include "vantage/clock.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace vantage::capture {

// Owns the Stopped/Running lifecycle of a capture session.
//
// Backend transitions run on a private serial executor so begin() and end()
// never overlap. The running flag flips under the controller lock before
// the backend work is queued, which is what callers observe through
// is_running(). Configuration edits and picker updates are expected from the
// owning thread.
class CaptureSessionController {
 public:
  using RunningListener = std::function<void(bool running)>;

  CaptureSessionController(CaptureConfiguration& config,
                           CaptureBackend& backend,
                           audio::AudioSampleSource& app_audio,
                           PickerCoordinator& picker);
  ~CaptureSessionController();

  CaptureSessionController(const CaptureSessionController&) = delete;
  CaptureSessionController& operator=(const CaptureSessionController&) = delete;

  // Resolves once the backend has settled. Validation errors and
  // AlreadyRunning resolve immediately.
  std::future<Status> start();
  // No-op when already stopped. A pending start is cancelled.
  std::future<void> stop();

  // A completed selection from the content picker. Starts the session when
  // stopped; while running the selection only applies to the next start.
  std::future<Status> on_picker_update(const PickerSelection& selection);

  Status present_picker();

  // Plays or stops the app's own audio. Returns whether it is playing after
  // the call.
  bool toggle_app_audio();

  // Errors raised by the backend while a session is live. Only a terminal
  // error ends the session.
  void on_backend_error(const std::string& detail, bool terminated);

  bool is_running() const;
  uint64_t picker_update_token() const;
  Status last_error() const;
  double session_elapsed_ms() const;

  // Listeners are called on the backend worker thread, one transition at a
  // time and in the order the transitions were decided.
  void connect_running_changed(RunningListener listener);

  // Waits for queued backend transitions to finish.
  void wait_idle();

  CaptureConfiguration& configuration() noexcept { return config_; }
  const CaptureConfiguration& configuration() const noexcept { return config_; }

 private:
  std::future<Status> start_locked(std::unique_lock<std::mutex>& lock);
  Status validate(const CaptureConfiguration& config) const;
  Status run_begin(uint64_t generation, const SessionSettings& settings);
  void on_config_changed(ConfigField field);
  // Caller holds mutex_. Listeners run on the executor in transition order.
  void post_running_changed(bool running);
  void notify_running(bool running);

  CaptureConfiguration& config_;
  CaptureBackend& backend_;
  audio::AudioSampleSource& app_audio_;
  PickerCoordinator& picker_;
  CaptureConfiguration::ListenerId config_listener_{0};

  mutable std::mutex mutex_;
  bool running_{false};
  uint64_t generation_{0};
  uint64_t picker_update_token_{0};
  vantage::clock::TimePoint session_start_{};
  Status last_error_;
  std::vector<RunningListener> running_listeners_;

  // Declared last: queued tasks touch the members above.
  util::SerialExecutor executor_;
};

}  // namespace vantage::capture
