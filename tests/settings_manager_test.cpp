#include "settings/settings_manager.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using vantage::capture::CaptureConfiguration;
using vantage::capture::CaptureType;
using vantage::capture::DynamicRangePreset;
using vantage::settings::SettingsManager;

namespace {

std::filesystem::path scratch_path(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("vantage-settings-test-" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  return dir / name;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream input(path);
  return std::string(std::istreambuf_iterator<char>(input),
                     std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
  {
    // Missing file: defaults, nothing written.
    const auto path = scratch_path("missing.ini");
    std::filesystem::remove(path);
    SettingsManager settings(path);
    assert(settings.data().capture_type == CaptureType::Display);
    assert(settings.data().app_excluded);
    assert(settings.data().audio_capture);
    assert(!settings.data().recording_directory.empty());
    assert(!std::filesystem::exists(path));
  }

  {
    const auto path = scratch_path("roundtrip.ini");
    std::filesystem::remove(path);
    {
      SettingsManager settings(path);
      CaptureConfiguration config;
      settings.apply_to(config);
      config.set_dynamic_range_preset(DynamicRangePreset::CanonicalDisplayHdr);
      config.set_mic_capture_enabled(true);
      config.set_picker_active(true);
      config.set_recording_stream(true);
      config.set_recording_directory("/tmp/vantage-recordings-test");
      settings.update_from(config);
      settings.set_log_level(vantage::log::Level::Debug);
    }
    const auto text = read_file(path);
    assert(text.find("dynamic_range_preset=Canonical Display HDR") != std::string::npos);
    assert(text.find("mic_capture=true") != std::string::npos);
    assert(text.find("log_level=debug") != std::string::npos);

    SettingsManager reloaded(path);
    CaptureConfiguration config;
    reloaded.apply_to(config);
    assert(config.dynamic_range_preset() == DynamicRangePreset::CanonicalDisplayHdr);
    assert(config.mic_capture_enabled());
    assert(config.picker_active());
    assert(config.recording_stream());
    assert(config.recording_directory() == "/tmp/vantage-recordings-test");
    assert(config.app_excluded());
    assert(reloaded.data().log_level == vantage::log::Level::Debug);
  }

  {
    // Malformed values are skipped; window capture never loads as excluded.
    const auto path = scratch_path("malformed.ini");
    {
      std::ofstream output(path, std::ios::trunc);
      output << "# comment\n";
      output << "capture_type=window\n";
      output << "app_excluded=true\n";
      output << "mic_capture=maybe\n";
      output << "dynamic_range_preset=Ultra HDR\n";
      output << "log_level=loud\n";
      output << "no separator here\n";
      output << "unknown_key=1\n";
    }
    SettingsManager settings(path);
    assert(settings.data().capture_type == CaptureType::Window);
    assert(!settings.data().app_excluded);
    assert(!settings.data().mic_capture);
    assert(!settings.data().dynamic_range_preset);
    assert(settings.data().log_level == vantage::log::Level::Info);

    CaptureConfiguration config;
    settings.apply_to(config);
    assert(config.capture_type() == CaptureType::Window);
    assert(!config.app_excluded());
  }

  {
    // Unchanged preferences do not rewrite the file.
    const auto path = scratch_path("unchanged.ini");
    std::filesystem::remove(path);
    SettingsManager settings(path);
    CaptureConfiguration config;
    settings.apply_to(config);
    settings.update_from(config);
    assert(!std::filesystem::exists(path));
  }

  std::filesystem::remove_all(scratch_path("x").parent_path());
  return 0;
}
