#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/capture_target.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace vantage::capture {

enum class ConfigField {
  CaptureType,
  SelectedDisplay,
  SelectedWindow,
  DynamicRangePreset,
  AppExcluded,
  MicCapture,
  AudioCapture,
  AppAudioExcluded,
  PickerActive,
  RecordingStream,
  RecordingDirectory
};

// User-selectable capture options. Setters keep the cross-field rules
// intact, so a configuration with capture type Window never has the app
// excluded. Subscribers are told about every effective change.
class CaptureConfiguration {
 public:
  using Listener = std::function<void(ConfigField)>;
  using ListenerId = std::size_t;

  CaptureConfiguration() = default;

  CaptureConfiguration(const CaptureConfiguration& other);
  CaptureConfiguration& operator=(const CaptureConfiguration& other);

  CaptureType capture_type() const noexcept { return capture_type_; }
  const std::optional<DisplayDescriptor>& selected_display() const noexcept {
    return selected_display_;
  }
  const std::optional<WindowDescriptor>& selected_window() const noexcept {
    return selected_window_;
  }
  const std::optional<DynamicRangePreset>& dynamic_range_preset() const noexcept {
    return dynamic_range_preset_;
  }
  bool app_excluded() const noexcept { return app_excluded_; }
  bool mic_capture_enabled() const noexcept { return mic_capture_enabled_; }
  bool audio_capture_enabled() const noexcept { return audio_capture_enabled_; }
  bool app_audio_excluded() const noexcept { return app_audio_excluded_; }
  bool picker_active() const noexcept { return picker_active_; }
  bool recording_stream() const noexcept { return recording_stream_; }
  const std::filesystem::path& recording_directory() const noexcept {
    return recording_directory_;
  }

  // Switching to Window clears app exclusion.
  void set_capture_type(CaptureType type);
  void set_selected_display(std::optional<DisplayDescriptor> display);
  void set_selected_window(std::optional<WindowDescriptor> window);
  void set_dynamic_range_preset(std::optional<DynamicRangePreset> preset);
  // Returns false, leaving the value unchanged, when exclusion cannot be
  // toggled for the current capture type.
  bool set_app_excluded(bool excluded);
  void set_mic_capture_enabled(bool enabled);
  void set_audio_capture_enabled(bool enabled);
  void set_app_audio_excluded(bool excluded);
  void set_picker_active(bool active);
  void set_recording_stream(bool recording);
  void set_recording_directory(std::filesystem::path directory);

  bool can_toggle_app_exclusion() const noexcept {
    return capture_type_ == CaptureType::Display;
  }
  bool can_toggle_app_audio_exclusion() const noexcept { return !app_excluded_; }
  bool can_configure_picker() const noexcept { return picker_active_; }
  bool can_present_picker() const noexcept { return picker_active_; }
  bool can_play_app_audio() const noexcept { return !app_excluded_; }

  bool effective_app_audio_excluded() const noexcept {
    return app_audio_excluded_ && !app_excluded_;
  }

  ListenerId subscribe(Listener listener);
  void unsubscribe(ListenerId id);

 private:
  void notify(ConfigField field);

  template <typename T>
  bool assign(T& slot, T value, ConfigField field) {
    if (slot == value) {
      return false;
    }
    slot = std::move(value);
    notify(field);
    return true;
  }

  CaptureType capture_type_{CaptureType::Display};
  std::optional<DisplayDescriptor> selected_display_;
  std::optional<WindowDescriptor> selected_window_;
  std::optional<DynamicRangePreset> dynamic_range_preset_;
  bool app_excluded_{true};
  bool mic_capture_enabled_{false};
  bool audio_capture_enabled_{true};
  bool app_audio_excluded_{false};
  bool picker_active_{false};
  bool recording_stream_{false};
  std::filesystem::path recording_directory_;

  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId next_listener_id_{1};
};

}  // namespace vantage::capture
