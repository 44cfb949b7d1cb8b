#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "audio/audio_sample_source.hpp"

#include <atomic>
#include <memory>

namespace vantage::audio {

// The application's own audio: a looping tone played through a PipeWire
// playback stream. Captures that include the app pick it up, which makes
// the app audio exclusion observable.
class TonePlayer : public AudioSampleSource {
 public:
  explicit TonePlayer(double frequency_hz = 440.0, float gain = 0.25f);
  ~TonePlayer() override;

  TonePlayer(const TonePlayer&) = delete;
  TonePlayer& operator=(const TonePlayer&) = delete;

  bool play() override;
  void stop() override;
  bool is_playing() const noexcept override { return playing_.load(); }
  float level() const noexcept override { return level_.load(); }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

  double frequency_hz_;
  std::atomic<float> gain_;
  std::atomic<float> level_{0.0f};
  std::atomic<bool> playing_{false};
};

}  // namespace vantage::audio
