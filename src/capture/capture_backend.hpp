#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/capture_configuration.hpp"
#include "capture/session_status.hpp"

#include <filesystem>
#include <optional>
#include <variant>

namespace vantage::capture {

using CaptureTarget = std::variant<DisplayDescriptor, WindowDescriptor>;

// Immutable snapshot of what a session captures, taken at start().
struct SessionSettings {
  CaptureTarget target;
  std::optional<DynamicRangePreset> dynamic_range_preset;
  bool app_excluded{false};
  bool mic_capture_enabled{false};
  bool audio_capture_enabled{false};
  bool app_audio_excluded{false};
  bool recording_stream{false};
  std::filesystem::path recording_directory;
};

// Returns nullopt when the configuration has no target for its capture type.
std::optional<SessionSettings> resolve_session_settings(
    const CaptureConfiguration& config);

std::string describe_target(const CaptureTarget& target);

class CaptureBackend {
 public:
  virtual ~CaptureBackend() = default;

  virtual Status begin(const SessionSettings& settings) = 0;
  // Must be safe to call when nothing is running.
  virtual void end() = 0;
};

}  // namespace vantage::capture
