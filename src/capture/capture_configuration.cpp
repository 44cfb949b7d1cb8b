#include "capture/capture_configuration.hpp"

#include "vantage/log.hpp"

#include <algorithm>

namespace vantage::capture {

// Copies carry the option values only; subscribers are not copied.
CaptureConfiguration::CaptureConfiguration(const CaptureConfiguration& other)
    : capture_type_(other.capture_type_),
      selected_display_(other.selected_display_),
      selected_window_(other.selected_window_),
      dynamic_range_preset_(other.dynamic_range_preset_),
      app_excluded_(other.app_excluded_),
      mic_capture_enabled_(other.mic_capture_enabled_),
      audio_capture_enabled_(other.audio_capture_enabled_),
      app_audio_excluded_(other.app_audio_excluded_),
      picker_active_(other.picker_active_),
      recording_stream_(other.recording_stream_),
      recording_directory_(other.recording_directory_) {}

CaptureConfiguration& CaptureConfiguration::operator=(
    const CaptureConfiguration& other) {
  if (this == &other) {
    return *this;
  }
  set_capture_type(other.capture_type_);
  set_selected_display(other.selected_display_);
  set_selected_window(other.selected_window_);
  set_dynamic_range_preset(other.dynamic_range_preset_);
  set_app_excluded(other.app_excluded_);
  set_mic_capture_enabled(other.mic_capture_enabled_);
  set_audio_capture_enabled(other.audio_capture_enabled_);
  set_app_audio_excluded(other.app_audio_excluded_);
  set_picker_active(other.picker_active_);
  set_recording_stream(other.recording_stream_);
  set_recording_directory(other.recording_directory_);
  return *this;
}

void CaptureConfiguration::set_capture_type(CaptureType type) {
  if (type == CaptureType::Window) {
    // Exclusion only applies to app windows inside a display capture.
    assign(app_excluded_, false, ConfigField::AppExcluded);
  }
  assign(capture_type_, type, ConfigField::CaptureType);
}

void CaptureConfiguration::set_selected_display(
    std::optional<DisplayDescriptor> display) {
  assign(selected_display_, std::move(display), ConfigField::SelectedDisplay);
}

void CaptureConfiguration::set_selected_window(
    std::optional<WindowDescriptor> window) {
  assign(selected_window_, std::move(window), ConfigField::SelectedWindow);
}

void CaptureConfiguration::set_dynamic_range_preset(
    std::optional<DynamicRangePreset> preset) {
  assign(dynamic_range_preset_, preset, ConfigField::DynamicRangePreset);
}

bool CaptureConfiguration::set_app_excluded(bool excluded) {
  if (excluded && !can_toggle_app_exclusion()) {
    vantage::log::debug("CaptureConfiguration: app exclusion refused for",
                        to_string(capture_type_), "capture");
    return false;
  }
  assign(app_excluded_, excluded, ConfigField::AppExcluded);
  return true;
}

void CaptureConfiguration::set_mic_capture_enabled(bool enabled) {
  assign(mic_capture_enabled_, enabled, ConfigField::MicCapture);
}

void CaptureConfiguration::set_audio_capture_enabled(bool enabled) {
  assign(audio_capture_enabled_, enabled, ConfigField::AudioCapture);
}

void CaptureConfiguration::set_app_audio_excluded(bool excluded) {
  assign(app_audio_excluded_, excluded, ConfigField::AppAudioExcluded);
}

void CaptureConfiguration::set_picker_active(bool active) {
  assign(picker_active_, active, ConfigField::PickerActive);
}

void CaptureConfiguration::set_recording_stream(bool recording) {
  assign(recording_stream_, recording, ConfigField::RecordingStream);
}

void CaptureConfiguration::set_recording_directory(std::filesystem::path directory) {
  assign(recording_directory_, std::move(directory),
         ConfigField::RecordingDirectory);
}

CaptureConfiguration::ListenerId CaptureConfiguration::subscribe(Listener listener) {
  const ListenerId id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void CaptureConfiguration::unsubscribe(ListenerId id) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& entry) {
                                    return entry.first == id;
                                  }),
                   listeners_.end());
}

void CaptureConfiguration::notify(ConfigField field) {
  // Listeners may subscribe from inside a callback; iterate over a copy.
  const auto listeners = listeners_;
  for (const auto& entry : listeners) {
    if (entry.second) {
      entry.second(field);
    }
  }
}

}  // namespace vantage::capture
