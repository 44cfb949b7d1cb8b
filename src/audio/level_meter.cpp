#include "audio/level_meter.hpp"

#include <algorithm>
#include <cmath>

namespace vantage::audio {

namespace {
constexpr double kFloorDb = -60.0;
}  // namespace

LevelMeter::LevelMeter(double smoothing)
    : smoothing_(std::clamp(smoothing, 0.0, 1.0)) {}

double LevelMeter::update(double level) {
  const double clamped = std::clamp(level, 0.0, 1.0);
  value_ = (value_ * smoothing_) + (clamped * (1.0 - smoothing_));
  value_ = std::clamp(value_, 0.0, 1.0);
  return value_;
}

double LevelMeter::to_dbfs(double level) {
  if (level <= 0.0) {
    return kFloorDb;
  }
  return std::max(kFloorDb, 20.0 * std::log10(std::min(level, 1.0)));
}

}  // namespace vantage::audio
