#include "app/displays.hpp"

#include "vantage/log.hpp"

#include <gdkmm/display.h>
#include <gdkmm/monitor.h>
#include <giomm/listmodel.h>
#include <gtkmm/window.h>

namespace vantage::app {

std::vector<capture::DisplayDescriptor> enumerate_displays() {
  std::vector<capture::DisplayDescriptor> displays;
  auto display = Gdk::Display::get_default();
  if (!display) {
    vantage::log::warn("enumerate_displays: no default display");
    return displays;
  }
  auto monitors = display->get_monitors();
  if (!monitors) {
    return displays;
  }
  for (guint i = 0; i < monitors->get_n_items(); ++i) {
    auto monitor = std::dynamic_pointer_cast<Gdk::Monitor>(monitors->get_object(i));
    if (!monitor) {
      continue;
    }
    Gdk::Rectangle geometry;
    monitor->get_geometry(geometry);

    capture::DisplayDescriptor descriptor;
    descriptor.id = i + 1;
    descriptor.name = monitor->get_connector();
    if (descriptor.name.empty()) {
      descriptor.name = monitor->get_model();
    }
    descriptor.width = geometry.get_width() * monitor->get_scale_factor();
    descriptor.height = geometry.get_height() * monitor->get_scale_factor();
    displays.push_back(std::move(descriptor));
  }
  return displays;
}

std::vector<capture::WindowDescriptor> enumerate_windows() {
  std::vector<capture::WindowDescriptor> windows;
  uint32_t id = 1;
  for (auto* window : Gtk::Window::list_toplevels()) {
    if (!window || !window->get_visible()) {
      continue;
    }
    capture::WindowDescriptor descriptor;
    descriptor.id = id++;
    descriptor.title = window->get_title();
    descriptor.application = "Vantage";
    windows.push_back(std::move(descriptor));
  }
  return windows;
}

}  // namespace vantage::app
