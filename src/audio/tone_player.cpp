#include "audio/tone_player.hpp"

#include "vantage/log.hpp"

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <mutex>
#include <thread>

#ifdef VANTAGE_HAVE_PIPEWIRE
extern "C" {
#include <pipewire/main-loop.h>
#include <pipewire/pipewire.h>
#include <pipewire/loop.h>
#include <spa/buffer/buffer.h>
#include <spa/param/audio/format-utils.h>
}
#endif

namespace vantage::audio {

namespace {

constexpr uint32_t kDefaultRate = 48000;
constexpr uint32_t kDefaultChannels = 2;
constexpr double kTwoPi = 6.283185307179586;

}  // namespace

struct TonePlayer::Impl {
  explicit Impl(TonePlayer& outer_ref) : outer(outer_ref) {}

  TonePlayer& outer;
  uint32_t rate{kDefaultRate};
  uint32_t channels{kDefaultChannels};
  double phase{0.0};

#ifdef VANTAGE_HAVE_PIPEWIRE
  pw_main_loop* loop{nullptr};
  pw_stream* stream{nullptr};
  std::thread thread;
  std::atomic<bool> running{false};

  void loop_body() {
    pw_loop* pwloop = pw_main_loop_get_loop(loop);
    while (running.load()) {
      pw_loop_iterate(pwloop, 10);
    }
  }

  bool create_stream() {
    spa_audio_info_raw info{};
    info.format = SPA_AUDIO_FORMAT_S16;
    info.rate = rate;
    info.channels = channels;
    info.position[0] = SPA_AUDIO_CHANNEL_FL;
    info.position[1] = SPA_AUDIO_CHANNEL_FR;

    pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio", PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music", PW_KEY_APP_NAME, "vantage", nullptr);

    stream = pw_stream_new_simple(pw_main_loop_get_loop(loop),
                                  "vantage-app-audio", props,
                                  &stream_events(), this);
    if (!stream) {
      vantage::log::warn("TonePlayer: failed to create playback stream");
      return false;
    }

    uint8_t buffer[256];
    spa_pod_builder builder;
    spa_pod_builder_init(&builder, buffer, sizeof(buffer));
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    const pw_stream_flags flags = static_cast<pw_stream_flags>(
        PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS |
        PW_STREAM_FLAG_RT_PROCESS);

    if (pw_stream_connect(stream, PW_DIRECTION_OUTPUT, PW_ID_ANY, flags,
                          params, 1) < 0) {
      vantage::log::warn("TonePlayer: playback connect failed");
      pw_stream_destroy(stream);
      stream = nullptr;
      return false;
    }
    return true;
  }

  void destroy_stream() {
    if (stream) {
      pw_stream_disconnect(stream);
      pw_stream_destroy(stream);
      stream = nullptr;
    }
  }

  static void on_state_changed(void* data, pw_stream_state old_state,
                               pw_stream_state state, const char* error) {
    auto* self = static_cast<Impl*>(data);
    vantage::log::debug("TonePlayer stream",
                        pw_stream_state_as_string(old_state), "->",
                        pw_stream_state_as_string(state));
    if (state == PW_STREAM_STATE_ERROR) {
      vantage::log::warn("TonePlayer stream error", error ? error : "unknown");
      // Leave teardown to stop(); it joins this thread.
      self->running = false;
      self->outer.playing_ = false;
      self->outer.level_.store(0.0f);
    }
  }

  static void on_param_changed(void* data, uint32_t id, const spa_pod* param) {
    auto* self = static_cast<Impl*>(data);
    if (!self || !param || id != SPA_PARAM_Format) {
      return;
    }
    spa_audio_info_raw info{};
    if (spa_format_audio_raw_parse(param, &info) < 0) {
      return;
    }
    if (info.rate > 0) {
      self->rate = info.rate;
    }
    if (info.channels > 0) {
      self->channels = info.channels;
    }
    vantage::log::info("TonePlayer format", "rate", self->rate, "channels",
                       self->channels);
  }

  static void on_process(void* data) {
    auto* self = static_cast<Impl*>(data);
    self->render();
  }

  static const pw_stream_events& stream_events() {
    static const pw_stream_events events = [] {
      pw_stream_events ev{};
      ev.version = PW_VERSION_STREAM_EVENTS;
      ev.state_changed = &Impl::on_state_changed;
      ev.param_changed = &Impl::on_param_changed;
      ev.process = &Impl::on_process;
      return ev;
    }();
    return events;
  }

  void render() {
    pw_buffer* buffer = pw_stream_dequeue_buffer(stream);
    if (!buffer) {
      return;
    }

    spa_buffer* spa = buffer->buffer;
    auto* spa_data = &spa->datas[0];
    if (!spa_data->data) {
      pw_stream_queue_buffer(stream, buffer);
      return;
    }

    const std::size_t frame_size = sizeof(int16_t) * channels;
    std::size_t frames = spa_data->maxsize / frame_size;
    if (buffer->requested > 0) {
      frames = std::min<std::size_t>(frames, buffer->requested);
    }

    auto* out = static_cast<int16_t*>(spa_data->data);
    const float gain = outer.gain_.load();
    const double step = kTwoPi * outer.frequency_hz_ / static_cast<double>(rate);
    double sum_sq = 0.0;
    for (std::size_t frame = 0; frame < frames; ++frame) {
      const float value = static_cast<float>(std::sin(phase)) * gain;
      phase += step;
      if (phase >= kTwoPi) {
        phase -= kTwoPi;
      }
      const float clamped = std::clamp(value, -1.0f, 1.0f);
      const auto sample = static_cast<int16_t>(clamped * 32767.0f);
      for (uint32_t c = 0; c < channels; ++c) {
        out[frame * channels + c] = sample;
      }
      sum_sq += static_cast<double>(clamped) * clamped;
    }
    if (frames > 0) {
      outer.level_.store(static_cast<float>(std::sqrt(sum_sq / frames)));
    }

    spa_data->chunk->offset = 0;
    spa_data->chunk->stride = static_cast<int32_t>(frame_size);
    spa_data->chunk->size = static_cast<uint32_t>(frames * frame_size);
    pw_stream_queue_buffer(stream, buffer);
  }
#endif  // VANTAGE_HAVE_PIPEWIRE
};

TonePlayer::TonePlayer(double frequency_hz, float gain)
    : frequency_hz_(frequency_hz), gain_(gain) {
#ifdef VANTAGE_HAVE_PIPEWIRE
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { pw_init(nullptr, nullptr); });
#endif
  impl_ = std::make_unique<Impl>(*this);
}

TonePlayer::~TonePlayer() {
  stop();
}

bool TonePlayer::play() {
#ifdef VANTAGE_HAVE_PIPEWIRE
  if (playing_) {
    return true;
  }
  stop();

  impl_->phase = 0.0;
  impl_->loop = pw_main_loop_new(nullptr);
  if (!impl_->loop) {
    vantage::log::warn("TonePlayer: failed to create main loop");
    return false;
  }
  if (!impl_->create_stream()) {
    pw_main_loop_destroy(impl_->loop);
    impl_->loop = nullptr;
    return false;
  }

  impl_->running = true;
  playing_ = true;
  impl_->thread = std::thread([this]() { impl_->loop_body(); });
  vantage::log::info("TonePlayer: playing", frequency_hz_, "Hz");
  return true;
#else
  vantage::log::warn("TonePlayer: PipeWire support not compiled in");
  return false;
#endif
}

void TonePlayer::stop() {
#ifdef VANTAGE_HAVE_PIPEWIRE
  impl_->running = false;
  if (impl_->loop) {
    pw_main_loop_quit(impl_->loop);
  }
  if (impl_->thread.joinable()) {
    impl_->thread.join();
  }
  impl_->destroy_stream();
  if (impl_->loop) {
    pw_main_loop_destroy(impl_->loop);
    impl_->loop = nullptr;
  }
  if (playing_.exchange(false)) {
    vantage::log::info("TonePlayer: stopped");
  }
#else
  playing_ = false;
#endif
  level_.store(0.0f);
}

}  // namespace vantage::audio
