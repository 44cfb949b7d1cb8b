#include "audio/level_meter.hpp"

#include <cassert>
#include <cmath>

using vantage::audio::LevelMeter;

int main() {
  {
    LevelMeter meter;
    assert(meter.value() == 0.0);
    const double first = meter.update(1.0);
    assert(std::abs(first - 0.15) < 1e-9);
    for (int i = 0; i < 200; ++i) {
      meter.update(1.0);
    }
    assert(meter.value() > 0.99 && meter.value() <= 1.0);
    meter.reset();
    assert(meter.value() == 0.0);
  }

  {
    LevelMeter meter(0.0);
    assert(meter.update(4.0) == 1.0);
    assert(meter.update(-1.0) == 0.0);
  }

  {
    assert(LevelMeter::to_dbfs(0.0) == -60.0);
    assert(std::abs(LevelMeter::to_dbfs(1.0)) < 1e-9);
    assert(std::abs(LevelMeter::to_dbfs(0.5) - (-6.0206)) < 1e-3);
    assert(LevelMeter::to_dbfs(1e-9) == -60.0);
  }

  return 0;
}
