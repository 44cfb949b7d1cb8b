#include "capture/session_controller.hpp"

#include "test_doubles.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

using vantage::capture::CaptureConfiguration;
using vantage::capture::CaptureSessionController;
using vantage::capture::CaptureType;
using vantage::capture::PickerSelection;
using vantage::capture::SessionErrc;
using vantage::test::FakeAudioSource;
using vantage::test::FakeBackend;
using vantage::test::FakePicker;

namespace {

struct Fixture {
  CaptureConfiguration config;
  FakeBackend backend;
  FakeAudioSource audio;
  FakePicker picker;
  CaptureSessionController controller{config, backend, audio, picker};
};

}  // namespace

int main() {
  {
    // start twice without stop.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    auto first = f.controller.start().get();
    assert(first.is_ok());
    assert(f.controller.is_running());
    auto second = f.controller.start().get();
    assert(second.is(SessionErrc::AlreadyRunning));
    assert(f.controller.is_running());
    assert(f.backend.begin_calls() == 1);
  }

  {
    // stop while stopped is a no-op.
    Fixture f;
    f.controller.stop().get();
    assert(!f.controller.is_running());
    f.controller.wait_idle();
    assert(f.backend.end_calls() == 0);
  }

  {
    Fixture f;
    auto status = f.controller.start().get();
    assert(status.is(SessionErrc::NoTargetSelected));
    assert(!f.controller.is_running());
    assert(f.backend.begin_calls() == 0);
    assert(f.controller.last_error().is(SessionErrc::NoTargetSelected));

    f.config.set_capture_type(CaptureType::Window);
    f.config.set_selected_display(vantage::test::display(1));
    status = f.controller.start().get();
    assert(status.is(SessionErrc::NoTargetSelected));
  }

  {
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.config.set_recording_stream(true);
    auto status = f.controller.start().get();
    assert(status.is(SessionErrc::InvalidConfiguration));
    assert(!f.controller.is_running());
  }

  {
    // Start then stop; the backend sees one begin and one end.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    assert(f.controller.start().get().is_ok());
    assert(f.backend.active());
    assert(f.controller.session_elapsed_ms() >= 0.0);
    f.controller.stop().get();
    assert(!f.controller.is_running());
    assert(!f.backend.active());
    assert(f.backend.end_calls() == 1);
    assert(f.controller.session_elapsed_ms() == 0.0);
  }

  {
    // Picker update while stopped starts with the picked display.
    Fixture f;
    assert(!f.config.selected_display());
    auto token = f.controller.picker_update_token();
    auto result = f.controller.on_picker_update(
        PickerSelection::of(vantage::test::display(1)));
    assert(f.controller.is_running());
    assert(result.get().is_ok());
    assert(f.config.selected_display());
    assert(f.config.selected_display()->id == 1);
    assert(f.controller.picker_update_token() == token + 1);

    const auto sessions = f.backend.sessions();
    assert(sessions.size() == 1);
    const auto* target =
        std::get_if<vantage::capture::DisplayDescriptor>(&sessions[0].target);
    assert(target && target->id == 1);
  }

  {
    // Picker update while running records the selection only.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    assert(f.controller.start().get().is_ok());

    auto result = f.controller.on_picker_update(
        PickerSelection::of(vantage::test::display(2)));
    assert(result.get().is_ok());
    f.controller.wait_idle();
    assert(f.controller.is_running());
    assert(f.config.selected_display()->id == 2);
    assert(f.backend.begin_calls() == 1);
    assert(f.backend.end_calls() == 0);

    // The next start uses it.
    f.controller.stop().get();
    assert(f.controller.start().get().is_ok());
    const auto sessions = f.backend.sessions();
    assert(sessions.size() == 2);
    assert(std::get<vantage::capture::DisplayDescriptor>(sessions[1].target).id == 2);
  }

  {
    // Picking a window switches to window capture.
    Fixture f;
    auto result = f.controller.on_picker_update(
        PickerSelection::of(vantage::test::window(7, "editor")));
    assert(result.get().is_ok());
    assert(f.config.capture_type() == CaptureType::Window);
    assert(!f.config.app_excluded());
    assert(f.controller.is_running());
  }

  {
    Fixture f;
    auto status = f.controller.present_picker();
    assert(status.is(SessionErrc::PickerInactive));
    assert(f.picker.present_calls == 0);

    f.config.set_picker_active(true);
    assert(f.picker.active && *f.picker.active);
    assert(f.controller.present_picker().is_ok());
    assert(f.picker.present_calls == 1);

    f.config.set_picker_active(false);
    assert(f.picker.active && !*f.picker.active);
  }

  {
    // Excluding the app stops its audio.
    Fixture f;
    f.config.set_app_excluded(false);
    assert(f.controller.toggle_app_audio());
    assert(f.audio.is_playing());
    f.config.set_app_excluded(true);
    assert(!f.audio.is_playing());

    assert(!f.controller.toggle_app_audio());
    assert(!f.audio.is_playing());
    assert(f.audio.play_calls == 1);
  }

  {
    // A second start issued while the first is still pending.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.hold();
    auto first = f.controller.start();
    f.backend.wait_entered();
    assert(f.controller.is_running());
    auto second = f.controller.start();
    assert(second.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    assert(second.get().is(SessionErrc::AlreadyRunning));
    f.backend.release();
    assert(first.get().is_ok());
    assert(f.controller.is_running());
  }

  {
    // Stop issued before a pending start completes ends Stopped.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.hold();
    auto started = f.controller.start();
    f.backend.wait_entered();
    auto stopped = f.controller.stop();
    assert(!f.controller.is_running());
    f.backend.release();
    assert(started.get().is_ok());
    stopped.get();
    assert(!f.controller.is_running());
    assert(!f.backend.active());
    assert(f.backend.end_calls() == 1);
  }

  {
    // Start, stop and start again while the backend is busy: the middle
    // session is skipped and the last one runs.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.hold();
    auto first = f.controller.start();
    f.backend.wait_entered();
    f.controller.stop();
    auto cancelled = f.controller.start();
    f.controller.stop();
    auto last = f.controller.start();
    f.backend.release();
    assert(first.get().is_ok());
    assert(cancelled.get().is_ok());
    assert(last.get().is_ok());
    f.controller.wait_idle();
    assert(f.controller.is_running());
    assert(f.backend.active());
    assert(f.backend.begin_calls() == 2);
  }

  {
    // Backend refusal reverts to Stopped. The flag outlives the controller.
    bool saw_stop = false;
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.fail_next();
    f.controller.connect_running_changed([&](bool running) {
      if (!running) {
        saw_stop = true;
      }
    });
    auto status = f.controller.start().get();
    assert(status.is(SessionErrc::BackendError));
    assert(status.detail() == "device busy");
    assert(!f.controller.is_running());
    f.controller.wait_idle();
    assert(saw_stop);
    assert(f.controller.last_error().is(SessionErrc::BackendError));

    assert(f.controller.start().get().is_ok());
  }

  {
    // Repeated fast backend refusals: listeners see every start followed by
    // its revert, and the last value matches is_running().
    std::mutex seen_mutex;
    std::vector<bool> seen;
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.controller.connect_running_changed([&](bool running) {
      std::lock_guard<std::mutex> lock(seen_mutex);
      seen.push_back(running);
    });
    constexpr int kAttempts = 500;
    for (int i = 0; i < kAttempts; ++i) {
      f.backend.fail_next();
      assert(f.controller.start().get().is(SessionErrc::BackendError));
      f.controller.wait_idle();
      std::lock_guard<std::mutex> lock(seen_mutex);
      assert(!seen.empty());
      assert(seen.back() == f.controller.is_running());
    }
    std::lock_guard<std::mutex> lock(seen_mutex);
    assert(seen.size() == 2 * kAttempts);
    for (size_t i = 0; i < seen.size(); ++i) {
      assert(seen[i] == (i % 2 == 0));
    }
  }

  {
    // A begin that fails after the caller stopped it leaves no error behind.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.hold();
    auto started = f.controller.start();
    f.backend.wait_entered();
    f.controller.stop();
    f.backend.fail_next();
    f.backend.release();
    assert(started.get().is(SessionErrc::BackendError));
    f.controller.wait_idle();
    assert(!f.controller.is_running());
    assert(f.controller.last_error().is_ok());
    assert(f.backend.end_calls() == 1);
  }

  {
    // Picker update while a start is still inside the backend: recorded for
    // the next start, no second begin.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.hold();
    auto started = f.controller.start();
    f.backend.wait_entered();
    const auto token = f.controller.picker_update_token();
    auto picked = f.controller.on_picker_update(
        PickerSelection::of(vantage::test::display(2)));
    assert(picked.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    assert(picked.get().is_ok());
    assert(f.config.selected_display()->id == 2);
    assert(f.controller.picker_update_token() == token + 1);
    f.backend.release();
    assert(started.get().is_ok());
    f.controller.wait_idle();
    assert(f.controller.is_running());
    assert(f.backend.begin_calls() == 1);
    assert(std::get<vantage::capture::DisplayDescriptor>(
               f.backend.sessions()[0].target).id == 1);
  }

  {
    // Picker update right after stop() while the backend is busy: the new
    // session is queued behind the end and runs with the picked target.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    f.backend.hold();
    auto started = f.controller.start();
    f.backend.wait_entered();
    auto stopped = f.controller.stop();
    auto picked = f.controller.on_picker_update(
        PickerSelection::of(vantage::test::display(2)));
    assert(f.controller.is_running());
    f.backend.release();
    assert(started.get().is_ok());
    stopped.get();
    assert(picked.get().is_ok());
    f.controller.wait_idle();
    const std::vector<std::string> expected{"begin", "end", "begin"};
    assert(f.backend.calls() == expected);
    assert(f.controller.is_running());
    assert(f.backend.active());
    const auto sessions = f.backend.sessions();
    assert(sessions.size() == 2);
    assert(std::get<vantage::capture::DisplayDescriptor>(sessions[1].target).id == 2);
  }

  {
    // Only a terminal backend error ends the session.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(1));
    assert(f.controller.start().get().is_ok());
    f.controller.on_backend_error("dropped frames", false);
    assert(f.controller.is_running());
    assert(f.controller.last_error().is(SessionErrc::BackendError));

    f.controller.on_backend_error("display unplugged", true);
    assert(!f.controller.is_running());
    f.controller.wait_idle();
    assert(!f.backend.active());
  }

  {
    // The backend only sees the active target and effective audio flags.
    Fixture f;
    f.config.set_selected_display(vantage::test::display(4));
    f.config.set_selected_window(vantage::test::window(9, "stale"));
    f.config.set_app_audio_excluded(true);
    f.config.set_mic_capture_enabled(true);
    assert(f.controller.start().get().is_ok());
    const auto settings = f.backend.sessions().front();
    assert(std::holds_alternative<vantage::capture::DisplayDescriptor>(settings.target));
    assert(settings.app_excluded);
    assert(!settings.app_audio_excluded);
    assert(settings.mic_capture_enabled);
  }

  return 0;
}
