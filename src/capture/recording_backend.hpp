#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/capture_backend.hpp"

#include <ctime>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace vantage::capture {

// Local backend: owns the recording output location of a session. Frame
// and audio encoding are handed to whatever pipeline consumes the reserved
// path.
class RecordingBackend : public CaptureBackend {
 public:
  RecordingBackend() = default;
  ~RecordingBackend() override;

  RecordingBackend(const RecordingBackend&) = delete;
  RecordingBackend& operator=(const RecordingBackend&) = delete;

  Status begin(const SessionSettings& settings) override;
  void end() override;

  bool is_active() const;
  std::optional<std::filesystem::path> output_path() const;

  static std::string output_file_name(std::time_t when);

 private:
  mutable std::mutex mutex_;
  bool active_{false};
  std::optional<std::filesystem::path> output_path_;
};

}  // namespace vantage::capture
