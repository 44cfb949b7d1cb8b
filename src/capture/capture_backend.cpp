#include "capture/capture_backend.hpp"

namespace vantage::capture {

std::optional<SessionSettings> resolve_session_settings(
    const CaptureConfiguration& config) {
  std::optional<CaptureTarget> target;
  if (config.capture_type() == CaptureType::Display) {
    if (config.selected_display()) {
      target = *config.selected_display();
    }
  } else if (config.selected_window()) {
    target = *config.selected_window();
  }
  if (!target) {
    return std::nullopt;
  }

  SessionSettings settings{*target};
  settings.dynamic_range_preset = config.dynamic_range_preset();
  settings.app_excluded = config.app_excluded();
  settings.mic_capture_enabled = config.mic_capture_enabled();
  settings.audio_capture_enabled = config.audio_capture_enabled();
  settings.app_audio_excluded = config.effective_app_audio_excluded();
  settings.recording_stream = config.recording_stream();
  settings.recording_directory = config.recording_directory();
  return settings;
}

std::string describe_target(const CaptureTarget& target) {
  if (const auto* display = std::get_if<DisplayDescriptor>(&target)) {
    return "display " + display->display_name();
  }
  return "window " + std::get<WindowDescriptor>(target).display_name();
}

}  // namespace vantage::capture
