#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>
//
// Simple logging helpers used across the codebase.

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace vantage::log {

enum class Level {
  Debug = 0,
  Info = 1,
  Warn = 2,
};

namespace detail {
inline std::mutex& stream_mutex() {
  static std::mutex mutex;
  return mutex;
}

inline std::atomic<int>& threshold() {
  static std::atomic<int> level{static_cast<int>(Level::Info)};
  return level;
}

inline bool enabled(Level level) {
  return static_cast<int>(level) >= threshold().load();
}

inline std::string timestamp() {
  using std::chrono::system_clock;
  const auto now = system_clock::now();
  const auto time = system_clock::to_time_t(now);
  const auto local = *std::localtime(&time);

  std::ostringstream oss;
  oss << std::put_time(&local, "%H:%M:%S");
  return oss.str();
}

template <typename... Args>
void write(std::ostream& out, std::string_view tag, std::string_view message,
           Args&&... args) {
  std::lock_guard<std::mutex> lock(stream_mutex());
  out << '[' << tag << ' ' << timestamp() << "] " << message;
  ((out << ' ' << std::forward<Args>(args)), ...);
  out << std::endl;
}
}  // namespace detail

inline void set_level(Level level) {
  detail::threshold().store(static_cast<int>(level));
}

inline std::optional<Level> parse_level(std::string_view name) {
  if (name == "debug") {
    return Level::Debug;
  }
  if (name == "info") {
    return Level::Info;
  }
  if (name == "warn" || name == "warning") {
    return Level::Warn;
  }
  return std::nullopt;
}

inline std::string_view level_name(Level level) {
  switch (level) {
    case Level::Debug:
      return "debug";
    case Level::Warn:
      return "warn";
    case Level::Info:
    default:
      return "info";
  }
}

// VANTAGE_LOG overrides whatever the settings file asked for.
inline void apply_environment() {
  if (const char* env = std::getenv("VANTAGE_LOG")) {
    if (const auto parsed = parse_level(env)) {
      set_level(*parsed);
    }
  }
}

template <typename... Args>
void debug(std::string_view message, Args&&... args) {
  if (!detail::enabled(Level::Debug)) {
    return;
  }
  detail::write(std::cout, "DEBUG", message, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view message, Args&&... args) {
  if (!detail::enabled(Level::Info)) {
    return;
  }
  detail::write(std::cout, "INFO", message, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view message, Args&&... args) {
  detail::write(std::cerr, "WARN", message, std::forward<Args>(args)...);
}

[[noreturn]] inline void fatal(std::string_view message) {
  detail::write(std::cerr, "FATAL", message);
  std::terminate();
}

}  // namespace vantage::log
