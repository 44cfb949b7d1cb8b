#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include <string>
#include <string_view>
#include <utility>

namespace vantage::capture {

enum class SessionErrc {
  AlreadyRunning,
  NoTargetSelected,
  InvalidConfiguration,
  PickerInactive,
  BackendError
};

std::string_view to_string(SessionErrc code);

// Outcome of a session operation. A default constructed Status is success.
class [[nodiscard]] Status {
 public:
  Status() = default;

  static Status ok() { return Status(); }
  static Status error(SessionErrc code, std::string detail = {}) {
    return Status(code, std::move(detail));
  }

  bool is_ok() const noexcept { return !failed_; }
  explicit operator bool() const noexcept { return is_ok(); }

  // Meaningful only when !is_ok().
  SessionErrc code() const noexcept { return code_; }
  const std::string& detail() const noexcept { return detail_; }

  bool is(SessionErrc code) const noexcept { return failed_ && code_ == code; }

  std::string message() const;

 private:
  Status(SessionErrc code, std::string detail)
      : failed_(true), code_(code), detail_(std::move(detail)) {}

  bool failed_{false};
  SessionErrc code_{SessionErrc::BackendError};
  std::string detail_;
};

}  // namespace vantage::capture
