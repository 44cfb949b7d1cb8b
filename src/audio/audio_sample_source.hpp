#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

namespace vantage::audio {

// Audio produced by the application itself, which a capture can include or
// exclude.
class AudioSampleSource {
 public:
  virtual ~AudioSampleSource() = default;

  virtual bool play() = 0;
  virtual void stop() = 0;
  virtual bool is_playing() const noexcept = 0;
  // Live RMS level in [0, 1].
  virtual float level() const noexcept = 0;
};

}  // namespace vantage::audio
