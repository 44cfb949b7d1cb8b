#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/capture_configuration.hpp"
#include "vantage/log.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace vantage::settings {

struct SettingsData {
  capture::CaptureType capture_type{capture::CaptureType::Display};
  std::optional<capture::DynamicRangePreset> dynamic_range_preset;
  bool app_excluded{true};
  bool mic_capture{false};
  bool audio_capture{true};
  bool app_audio_excluded{false};
  bool picker_active{false};
  bool recording_stream{false};
  std::filesystem::path recording_directory;
  vantage::log::Level log_level{vantage::log::Level::Info};
};

bool operator==(const SettingsData& a, const SettingsData& b);
inline bool operator!=(const SettingsData& a, const SettingsData& b) {
  return !(a == b);
}

class SettingsManager {
 public:
  SettingsManager();
  explicit SettingsManager(std::filesystem::path config_path);

  const SettingsData& data() const noexcept { return data_; }
  const std::filesystem::path& path() const noexcept { return config_path_; }

  // Copies the persisted preferences into a configuration. Target
  // selections are not persisted.
  void apply_to(capture::CaptureConfiguration& config) const;
  // Persists the preferences of a configuration when they changed.
  void update_from(const capture::CaptureConfiguration& config);

  void set_log_level(vantage::log::Level level);

  static std::filesystem::path default_config_path();
  static std::filesystem::path default_recording_directory();

 private:
  void load();
  void save() const;
  void store(const SettingsData& data);

  std::filesystem::path config_path_;
  SettingsData data_;
};

}  // namespace vantage::settings
