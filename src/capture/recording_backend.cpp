#include "capture/recording_backend.hpp"

#include "vantage/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace vantage::capture {

RecordingBackend::~RecordingBackend() {
  end();
}

std::string RecordingBackend::output_file_name(std::time_t when) {
  const auto local = *std::localtime(&when);
  std::ostringstream oss;
  oss << "vantage-" << std::put_time(&local, "%Y%m%d-%H%M%S") << ".mkv";
  return oss.str();
}

Status RecordingBackend::begin(const SessionSettings& settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    return Status::error(SessionErrc::BackendError, "session already active");
  }

  std::optional<std::filesystem::path> output;
  if (settings.recording_stream) {
    std::error_code ec;
    std::filesystem::create_directories(settings.recording_directory, ec);
    if (ec) {
      vantage::log::warn("RecordingBackend: unable to create",
                         settings.recording_directory.string(), ec.message());
      return Status::error(SessionErrc::BackendError,
                           "cannot create " +
                               settings.recording_directory.string() + ": " +
                               ec.message());
    }
    const auto now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    output = settings.recording_directory / output_file_name(now);
  }

  active_ = true;
  output_path_ = output;
  vantage::log::info("RecordingBackend: session on", describe_target(settings.target),
                     "hdr", preset_label(settings.dynamic_range_preset),
                     "mic", settings.mic_capture_enabled,
                     "audio", settings.audio_capture_enabled,
                     "app_audio_excluded", settings.app_audio_excluded);
  if (output_path_) {
    vantage::log::info("RecordingBackend: recording to", output_path_->string());
  }
  return Status::ok();
}

void RecordingBackend::end() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_) {
    return;
  }
  active_ = false;
  vantage::log::info("RecordingBackend: session ended");
}

bool RecordingBackend::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::optional<std::filesystem::path> RecordingBackend::output_path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return output_path_;
}

}  // namespace vantage::capture
