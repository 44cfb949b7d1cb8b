#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/capture_target.hpp"

#include <optional>
#include <utility>

namespace vantage::capture {

// What the user chose in the picker. Exactly one of the two is set.
struct PickerSelection {
  std::optional<DisplayDescriptor> display;
  std::optional<WindowDescriptor> window;

  static PickerSelection of(DisplayDescriptor d) {
    PickerSelection selection;
    selection.display = std::move(d);
    return selection;
  }
  static PickerSelection of(WindowDescriptor w) {
    PickerSelection selection;
    selection.window = std::move(w);
    return selection;
  }
};

// The content picker surface. present() returns immediately; the user's
// choice arrives later through CaptureSessionController::on_picker_update.
class PickerCoordinator {
 public:
  virtual ~PickerCoordinator() = default;

  virtual void present() = 0;
  virtual void set_active(bool active) = 0;
};

}  // namespace vantage::capture
