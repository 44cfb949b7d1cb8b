#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

namespace vantage::audio {

// Smooths a live level for display. Levels are clamped to [0, 1].
class LevelMeter {
 public:
  explicit LevelMeter(double smoothing = 0.85);

  double update(double level);
  void reset() noexcept { value_ = 0.0; }
  double value() const noexcept { return value_; }

  // Silence maps to the floor (-60 dBFS).
  static double to_dbfs(double level);

 private:
  double smoothing_;
  double value_{0.0};
};

}  // namespace vantage::audio
