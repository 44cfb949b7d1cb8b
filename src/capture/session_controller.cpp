#include "capture/session_controller.hpp"

#include "vantage/log.hpp"

#include <utility>

namespace vantage::capture {

namespace {

template <typename T>
std::future<T> ready_future(T value) {
  std::promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

std::future<void> ready_future() {
  std::promise<void> promise;
  promise.set_value();
  return promise.get_future();
}

}  // namespace

CaptureSessionController::CaptureSessionController(
    CaptureConfiguration& config, CaptureBackend& backend,
    audio::AudioSampleSource& app_audio, PickerCoordinator& picker)
    : config_(config), backend_(backend), app_audio_(app_audio), picker_(picker) {
  config_listener_ = config_.subscribe(
      [this](ConfigField field) { on_config_changed(field); });

  picker_.set_active(config_.picker_active());
  if (config_.app_excluded() && app_audio_.is_playing()) {
    app_audio_.stop();
  }
}

CaptureSessionController::~CaptureSessionController() {
  config_.unsubscribe(config_listener_);
  stop();
  executor_.wait_idle();
}

std::future<Status> CaptureSessionController::start() {
  std::unique_lock<std::mutex> lock(mutex_);
  return start_locked(lock);
}

std::future<Status> CaptureSessionController::start_locked(
    std::unique_lock<std::mutex>& lock) {
  if (running_) {
    vantage::log::debug("CaptureSessionController: start ignored, already running");
    return ready_future(Status::error(SessionErrc::AlreadyRunning));
  }

  Status status = validate(config_);
  if (!status) {
    last_error_ = status;
    lock.unlock();
    vantage::log::warn("CaptureSessionController: cannot start:", status.message());
    return ready_future(std::move(status));
  }

  // validate() guarantees a target for the active capture type.
  const SessionSettings settings = *resolve_session_settings(config_);

  running_ = true;
  const uint64_t generation = ++generation_;
  session_start_ = vantage::clock::now();
  last_error_ = Status::ok();
  // Queue under the lock so backend work and listeners run in decision order.
  post_running_changed(true);
  auto result = executor_.post([this, generation, settings]() {
    return run_begin(generation, settings);
  });
  lock.unlock();

  vantage::log::info("CaptureSessionController: starting",
                     describe_target(settings.target),
                     settings.recording_stream ? "with recording" : "");
  return result;
}

std::future<void> CaptureSessionController::stop() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!running_) {
    return ready_future();
  }
  running_ = false;
  ++generation_;
  post_running_changed(false);
  auto result = executor_.post([this]() { backend_.end(); });
  const double elapsed = vantage::clock::milliseconds_since(session_start_);
  lock.unlock();

  vantage::log::info("CaptureSessionController: stopping after", elapsed, "ms");
  return result;
}

std::future<Status> CaptureSessionController::on_picker_update(
    const PickerSelection& selection) {
  if (selection.display) {
    config_.set_selected_display(selection.display);
    config_.set_capture_type(CaptureType::Display);
  } else if (selection.window) {
    config_.set_selected_window(selection.window);
    config_.set_capture_type(CaptureType::Window);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  ++picker_update_token_;
  if (running_) {
    lock.unlock();
    // The live stream keeps its target; the selection is used next start.
    vantage::log::info("CaptureSessionController: picker selection recorded for next start");
    return ready_future(Status::ok());
  }
  return start_locked(lock);
}

Status CaptureSessionController::present_picker() {
  if (!config_.can_present_picker()) {
    Status status = Status::error(SessionErrc::PickerInactive);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_ = status;
    }
    vantage::log::warn("CaptureSessionController:", status.message());
    return status;
  }
  picker_.present();
  return Status::ok();
}

bool CaptureSessionController::toggle_app_audio() {
  if (app_audio_.is_playing()) {
    app_audio_.stop();
    return false;
  }
  if (!config_.can_play_app_audio()) {
    vantage::log::warn("CaptureSessionController: app audio unavailable while the app is excluded");
    return false;
  }
  if (!app_audio_.play()) {
    vantage::log::warn("CaptureSessionController: app audio failed to start");
    return false;
  }
  return true;
}

void CaptureSessionController::on_backend_error(const std::string& detail,
                                                bool terminated) {
  std::unique_lock<std::mutex> lock(mutex_);
  last_error_ = Status::error(SessionErrc::BackendError, detail);
  if (terminated && running_) {
    running_ = false;
    ++generation_;
    post_running_changed(false);
    // Backend end() is idempotent; releasing its resources is still our job.
    executor_.post([this]() { backend_.end(); });
  }
  lock.unlock();

  vantage::log::warn("CaptureSessionController: backend error", detail,
                     terminated ? "(terminated)" : "");
}

bool CaptureSessionController::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

uint64_t CaptureSessionController::picker_update_token() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return picker_update_token_;
}

Status CaptureSessionController::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

double CaptureSessionController::session_elapsed_ms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    return 0.0;
  }
  return vantage::clock::milliseconds_since(session_start_);
}

void CaptureSessionController::connect_running_changed(RunningListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  running_listeners_.push_back(std::move(listener));
}

void CaptureSessionController::wait_idle() {
  executor_.wait_idle();
}

Status CaptureSessionController::validate(const CaptureConfiguration& config) const {
  if (config.app_excluded() && config.capture_type() == CaptureType::Window) {
    return Status::error(SessionErrc::InvalidConfiguration,
                         "app exclusion requires a display capture");
  }
  if (!resolve_session_settings(config)) {
    return Status::error(SessionErrc::NoTargetSelected,
                         std::string(to_string(config.capture_type())));
  }
  if (config.recording_stream() && config.recording_directory().empty()) {
    return Status::error(SessionErrc::InvalidConfiguration,
                         "recording requested without an output directory");
  }
  return Status::ok();
}

Status CaptureSessionController::run_begin(uint64_t generation,
                                           const SessionSettings& settings) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || !running_) {
      vantage::log::debug("CaptureSessionController: start cancelled before backend begin");
      return Status::ok();
    }
  }

  Status status = backend_.begin(settings);
  if (status) {
    return status;
  }
  if (!status.is(SessionErrc::BackendError)) {
    status = Status::error(SessionErrc::BackendError, status.message());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    // A session the caller already stopped is not reported as failed.
    if (generation == generation_ && running_) {
      last_error_ = status;
      running_ = false;
      ++generation_;
      // Runs after this task, behind the notification of the start.
      post_running_changed(false);
    }
  }
  vantage::log::warn("CaptureSessionController: backend refused session:",
                     status.message());
  return status;
}

void CaptureSessionController::on_config_changed(ConfigField field) {
  switch (field) {
    case ConfigField::AppExcluded:
      if (config_.app_excluded() && app_audio_.is_playing()) {
        vantage::log::info("CaptureSessionController: app excluded, stopping app audio");
        app_audio_.stop();
      }
      break;
    case ConfigField::PickerActive:
      picker_.set_active(config_.picker_active());
      break;
    default:
      if (is_running()) {
        vantage::log::debug("CaptureSessionController: configuration change applies on next start");
      }
      break;
  }
}

void CaptureSessionController::post_running_changed(bool running) {
  executor_.post([this, running]() { notify_running(running); });
}

void CaptureSessionController::notify_running(bool running) {
  std::vector<RunningListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners = running_listeners_;
  }
  for (const auto& listener : listeners) {
    if (listener) {
      listener(running);
    }
  }
}

}  // namespace vantage::capture
