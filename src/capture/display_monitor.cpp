#include "capture/display_monitor.hpp"

#include "vantage/log.hpp"

#ifdef VANTAGE_HAVE_UDEV
#include <libudev.h>
#include <poll.h>

#include <cstring>
#endif

namespace vantage::capture {

DisplayMonitor::DisplayMonitor(Callback callback)
    : callback_(std::move(callback)) {
  running_ = true;
  thread_ = std::thread([this]() { run(); });
}

DisplayMonitor::~DisplayMonitor() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

void DisplayMonitor::run() {
#ifdef VANTAGE_HAVE_UDEV
  udev* udev_ctx = udev_new();
  if (!udev_ctx) {
    vantage::log::warn("DisplayMonitor: unable to create udev context");
    return;
  }

  udev_monitor* monitor = udev_monitor_new_from_netlink(udev_ctx, "udev");
  if (!monitor) {
    vantage::log::warn("DisplayMonitor: unable to create monitor");
    udev_unref(udev_ctx);
    return;
  }

  udev_monitor_filter_add_match_subsystem_devtype(monitor, "drm", nullptr);
  udev_monitor_enable_receiving(monitor);

  pollfd pfd{};
  pfd.fd = udev_monitor_get_fd(monitor);
  pfd.events = POLLIN;

  while (running_) {
    const int ret = poll(&pfd, 1, 1000);
    if (ret <= 0 || !(pfd.revents & POLLIN)) {
      continue;
    }
    udev_device* device = udev_monitor_receive_device(monitor);
    if (!device) {
      continue;
    }
    const char* action = udev_device_get_action(device);
    const char* hotplug = udev_device_get_property_value(device, "HOTPLUG");
    const bool relevant =
        (action && std::strcmp(action, "change") != 0) ||
        (hotplug && std::strcmp(hotplug, "1") == 0);
    if (relevant) {
      vantage::log::info("DisplayMonitor event:", action ? action : "change",
                         udev_device_get_sysname(device));
      if (callback_) {
        callback_();
      }
    }
    udev_device_unref(device);
  }

  udev_monitor_unref(monitor);
  udev_unref(udev_ctx);
#else
  vantage::log::debug("DisplayMonitor: built without udev, hotplug not watched");
  (void)callback_;
#endif
}

}  // namespace vantage::capture
