#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/capture_target.hpp"

#include <vector>

namespace vantage::app {

// Monitors known to the default GDK display.
std::vector<capture::DisplayDescriptor> enumerate_displays();

// Toplevel windows of this application, the only windows a Wayland client
// can name without a portal.
std::vector<capture::WindowDescriptor> enumerate_windows();

}  // namespace vantage::app
