#include "capture/session_status.hpp"

namespace vantage::capture {

std::string_view to_string(SessionErrc code) {
  switch (code) {
    case SessionErrc::AlreadyRunning:
      return "capture session already running";
    case SessionErrc::NoTargetSelected:
      return "no capture target selected";
    case SessionErrc::InvalidConfiguration:
      return "invalid capture configuration";
    case SessionErrc::PickerInactive:
      return "content picker is not active";
    case SessionErrc::BackendError:
    default:
      return "capture backend error";
  }
}

std::string Status::message() const {
  if (is_ok()) {
    return "ok";
  }
  std::string text(to_string(code_));
  if (!detail_.empty()) {
    text += ": " + detail_;
  }
  return text;
}

}  // namespace vantage::capture
