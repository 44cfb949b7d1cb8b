#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vantage::capture {

enum class CaptureType {
  Display,
  Window
};

enum class DynamicRangePreset {
  LocalDisplayHdr,
  CanonicalDisplayHdr,
  HdrLocalScreenshot,
  HdrCanonicalScreenshot
};

struct DisplayDescriptor {
  uint32_t id{0};
  std::string name;
  int width{0};
  int height{0};

  std::string display_name() const;
};

struct WindowDescriptor {
  uint32_t id{0};
  std::string title;
  std::string application;

  std::string display_name() const;
};

inline bool operator==(const DisplayDescriptor& a, const DisplayDescriptor& b) {
  return a.id == b.id && a.name == b.name && a.width == b.width &&
         a.height == b.height;
}
inline bool operator!=(const DisplayDescriptor& a, const DisplayDescriptor& b) {
  return !(a == b);
}
inline bool operator==(const WindowDescriptor& a, const WindowDescriptor& b) {
  return a.id == b.id && a.title == b.title && a.application == b.application;
}
inline bool operator!=(const WindowDescriptor& a, const WindowDescriptor& b) {
  return !(a == b);
}

const std::vector<DynamicRangePreset>& all_dynamic_range_presets();

std::string_view to_string(CaptureType type);
std::string_view to_string(DynamicRangePreset preset);
// Human readable label, "Default (None)" for an absent preset.
std::string preset_label(const std::optional<DynamicRangePreset>& preset);

std::optional<CaptureType> parse_capture_type(std::string_view text);
std::optional<DynamicRangePreset> parse_dynamic_range_preset(std::string_view text);

}  // namespace vantage::capture
