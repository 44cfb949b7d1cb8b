#include "settings/settings_manager.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vantage::settings {

namespace {

std::filesystem::path config_directory() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
    return std::filesystem::path(xdg) / "vantage";
  }
  if (const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".config" / "vantage";
  }
  return std::filesystem::temp_directory_path() / "vantage";
}

std::optional<bool> parse_bool(const std::string& value) {
  if (value == "1" || value == "true") {
    return true;
  }
  if (value == "0" || value == "false") {
    return false;
  }
  return std::nullopt;
}

const char* bool_text(bool value) {
  return value ? "true" : "false";
}

}  // namespace

bool operator==(const SettingsData& a, const SettingsData& b) {
  return a.capture_type == b.capture_type &&
         a.dynamic_range_preset == b.dynamic_range_preset &&
         a.app_excluded == b.app_excluded && a.mic_capture == b.mic_capture &&
         a.audio_capture == b.audio_capture &&
         a.app_audio_excluded == b.app_audio_excluded &&
         a.picker_active == b.picker_active &&
         a.recording_stream == b.recording_stream &&
         a.recording_directory == b.recording_directory &&
         a.log_level == b.log_level;
}

SettingsManager::SettingsManager() : SettingsManager(default_config_path()) {}

SettingsManager::SettingsManager(std::filesystem::path config_path)
    : config_path_(std::move(config_path)) {
  data_.recording_directory = default_recording_directory();
  load();
}

std::filesystem::path SettingsManager::default_config_path() {
  return config_directory() / "config.ini";
}

std::filesystem::path SettingsManager::default_recording_directory() {
  if (const char* videos = std::getenv("XDG_VIDEOS_DIR")) {
    return std::filesystem::path(videos) / "Vantage";
  }
  if (const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home) / "Videos" / "Vantage";
  }
  return std::filesystem::temp_directory_path() / "vantage-recordings";
}

void SettingsManager::load() {
  std::error_code ec;
  std::filesystem::create_directories(config_path_.parent_path(), ec);

  std::ifstream input(config_path_);
  if (!input.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(input, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto pos = line.find('=');
    if (pos == std::string::npos) {
      continue;
    }
    const std::string key = line.substr(0, pos);
    const std::string value = line.substr(pos + 1);

    if (key == "capture_type") {
      if (const auto type = capture::parse_capture_type(value)) {
        data_.capture_type = *type;
      }
    } else if (key == "dynamic_range_preset") {
      data_.dynamic_range_preset = capture::parse_dynamic_range_preset(value);
    } else if (key == "recording_directory") {
      if (!value.empty()) {
        data_.recording_directory = value;
      }
    } else if (key == "log_level") {
      if (const auto level = vantage::log::parse_level(value)) {
        data_.log_level = *level;
      }
    } else {
      const auto flag = parse_bool(value);
      if (!flag) {
        vantage::log::warn("SettingsManager: ignoring", key, "=", value);
        continue;
      }
      if (key == "app_excluded") {
        data_.app_excluded = *flag;
      } else if (key == "mic_capture") {
        data_.mic_capture = *flag;
      } else if (key == "audio_capture") {
        data_.audio_capture = *flag;
      } else if (key == "app_audio_excluded") {
        data_.app_audio_excluded = *flag;
      } else if (key == "picker_active") {
        data_.picker_active = *flag;
      } else if (key == "recording_stream") {
        data_.recording_stream = *flag;
      }
    }
  }

  // A hand-edited file may ask for both.
  if (data_.capture_type == capture::CaptureType::Window) {
    data_.app_excluded = false;
  }
}

void SettingsManager::save() const {
  std::ofstream output(config_path_, std::ios::trunc);
  if (!output.is_open()) {
    vantage::log::warn("SettingsManager: unable to write", config_path_.string());
    return;
  }
  output << "capture_type=" << capture::to_string(data_.capture_type) << "\n";
  output << "dynamic_range_preset=";
  if (data_.dynamic_range_preset) {
    output << capture::to_string(*data_.dynamic_range_preset);
  }
  output << "\n";
  output << "app_excluded=" << bool_text(data_.app_excluded) << "\n";
  output << "mic_capture=" << bool_text(data_.mic_capture) << "\n";
  output << "audio_capture=" << bool_text(data_.audio_capture) << "\n";
  output << "app_audio_excluded=" << bool_text(data_.app_audio_excluded) << "\n";
  output << "picker_active=" << bool_text(data_.picker_active) << "\n";
  output << "recording_stream=" << bool_text(data_.recording_stream) << "\n";
  output << "recording_directory=" << data_.recording_directory.string() << "\n";
  output << "log_level=" << vantage::log::level_name(data_.log_level) << "\n";
}

void SettingsManager::store(const SettingsData& data) {
  if (data_ == data) {
    return;
  }
  data_ = data;
  save();
}

void SettingsManager::apply_to(capture::CaptureConfiguration& config) const {
  config.set_capture_type(data_.capture_type);
  config.set_dynamic_range_preset(data_.dynamic_range_preset);
  if (!config.set_app_excluded(data_.app_excluded)) {
    vantage::log::warn("SettingsManager: stored app exclusion not applicable");
  }
  config.set_mic_capture_enabled(data_.mic_capture);
  config.set_audio_capture_enabled(data_.audio_capture);
  config.set_app_audio_excluded(data_.app_audio_excluded);
  config.set_picker_active(data_.picker_active);
  config.set_recording_stream(data_.recording_stream);
  config.set_recording_directory(data_.recording_directory);
}

void SettingsManager::update_from(const capture::CaptureConfiguration& config) {
  SettingsData next = data_;
  next.capture_type = config.capture_type();
  next.dynamic_range_preset = config.dynamic_range_preset();
  next.app_excluded = config.app_excluded();
  next.mic_capture = config.mic_capture_enabled();
  next.audio_capture = config.audio_capture_enabled();
  next.app_audio_excluded = config.app_audio_excluded();
  next.picker_active = config.picker_active();
  next.recording_stream = config.recording_stream();
  next.recording_directory = config.recording_directory();
  store(next);
}

void SettingsManager::set_log_level(vantage::log::Level level) {
  SettingsData next = data_;
  next.log_level = level;
  store(next);
}

}  // namespace vantage::settings
