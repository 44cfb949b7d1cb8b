#include "capture/capture_target.hpp"

namespace vantage::capture {

std::string DisplayDescriptor::display_name() const {
  std::string label = name.empty() ? "Display " + std::to_string(id) : name;
  if (width > 0 && height > 0) {
    label += " (" + std::to_string(width) + "x" + std::to_string(height) + ")";
  }
  return label;
}

std::string WindowDescriptor::display_name() const {
  if (application.empty()) {
    return title.empty() ? "Window " + std::to_string(id) : title;
  }
  if (title.empty()) {
    return application;
  }
  return application + ": " + title;
}

const std::vector<DynamicRangePreset>& all_dynamic_range_presets() {
  static const std::vector<DynamicRangePreset> presets = {
      DynamicRangePreset::LocalDisplayHdr,
      DynamicRangePreset::CanonicalDisplayHdr,
      DynamicRangePreset::HdrLocalScreenshot,
      DynamicRangePreset::HdrCanonicalScreenshot,
  };
  return presets;
}

std::string_view to_string(CaptureType type) {
  switch (type) {
    case CaptureType::Window:
      return "window";
    case CaptureType::Display:
    default:
      return "display";
  }
}

std::string_view to_string(DynamicRangePreset preset) {
  switch (preset) {
    case DynamicRangePreset::LocalDisplayHdr:
      return "Local Display HDR";
    case DynamicRangePreset::CanonicalDisplayHdr:
      return "Canonical Display HDR";
    case DynamicRangePreset::HdrLocalScreenshot:
      return "HDR Local Screenshot";
    case DynamicRangePreset::HdrCanonicalScreenshot:
    default:
      return "HDR Canonical Screenshot";
  }
}

std::string preset_label(const std::optional<DynamicRangePreset>& preset) {
  if (!preset) {
    return "Default (None)";
  }
  return std::string(to_string(*preset));
}

std::optional<CaptureType> parse_capture_type(std::string_view text) {
  if (text == "display") {
    return CaptureType::Display;
  }
  if (text == "window") {
    return CaptureType::Window;
  }
  return std::nullopt;
}

std::optional<DynamicRangePreset> parse_dynamic_range_preset(std::string_view text) {
  for (const auto preset : all_dynamic_range_presets()) {
    if (text == to_string(preset)) {
      return preset;
    }
  }
  return std::nullopt;
}

}  // namespace vantage::capture
