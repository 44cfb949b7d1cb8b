#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "app/picker_dialog.hpp"
#include "audio/level_meter.hpp"
#include "audio/tone_player.hpp"
#include "capture/capture_configuration.hpp"
#include "capture/display_monitor.hpp"
#include "capture/recording_backend.hpp"
#include "capture/session_controller.hpp"
#include "settings/settings_manager.hpp"

#include <gtkmm/applicationwindow.h>
#include <gtkmm/box.h>
#include <gtkmm/button.h>
#include <gtkmm/checkbutton.h>
#include <gtkmm/comboboxtext.h>
#include <gtkmm/headerbar.h>
#include <gtkmm/label.h>
#include <gtkmm/levelbar.h>

#include <future>
#include <memory>
#include <vector>

namespace vantage::app {

class MainWindow : public Gtk::ApplicationWindow {
 public:
  MainWindow();
  ~MainWindow() override;

 private:
  void build_ui();
  Gtk::Label* append_header(const char* title);
  void refresh_targets();
  void populate_target_combo();
  void sync_from_config();
  void update_session_ui();
  bool on_frame_tick(const Glib::RefPtr<Gdk::FrameClock>& clock);

  void on_config_changed(capture::ConfigField field);
  void on_capture_type_changed();
  void on_target_changed();
  void on_preset_changed();
  void on_start_clicked();
  void on_stop_clicked();
  void on_present_picker_clicked();
  void on_play_audio_clicked();
  void on_view_recordings_clicked();
  void on_picker_selection(const capture::PickerSelection& selection);
  void report_start_result(std::shared_future<capture::Status> result);

  Gtk::Box root_{Gtk::Orientation::VERTICAL};
  Gtk::Box form_{Gtk::Orientation::VERTICAL};
  Gtk::HeaderBar* header_bar_{nullptr};

  Gtk::ComboBoxText capture_type_combo_;
  Gtk::ComboBoxText target_combo_;
  Gtk::ComboBoxText preset_combo_;
  Gtk::CheckButton exclude_app_check_{"Exclude Vantage from stream"};

  Gtk::CheckButton mic_check_{"Add mic output"};
  Gtk::CheckButton audio_check_{"Capture audio"};
  Gtk::CheckButton exclude_app_audio_check_{"Exclude app audio"};
  Gtk::LevelBar audio_level_bar_;
  Gtk::Button play_audio_button_{"Play App Audio"};

  Gtk::CheckButton picker_active_check_{"Activate Picker"};
  Gtk::Button picker_settings_button_{"Picker Configuration"};
  Gtk::Button present_picker_button_{"Present Picker"};

  Gtk::Box recording_row_{Gtk::Orientation::HORIZONTAL};
  Gtk::CheckButton recording_check_{"Add screen recording output"};
  Gtk::Label recording_indicator_;
  Gtk::Button view_recordings_button_{"View Recordings"};

  Gtk::Box button_row_{Gtk::Orientation::HORIZONTAL};
  Gtk::Button start_button_{"Start Capture"};
  Gtk::Button stop_button_{"Stop Capture"};
  Gtk::Label status_label_;

  settings::SettingsManager settings_;
  capture::CaptureConfiguration config_;
  capture::RecordingBackend backend_;
  audio::TonePlayer app_audio_;
  audio::LevelMeter level_meter_;
  PickerDialog picker_;
  std::unique_ptr<capture::CaptureSessionController> controller_;
  std::unique_ptr<capture::DisplayMonitor> display_monitor_;

  std::vector<capture::DisplayDescriptor> displays_;
  std::vector<capture::WindowDescriptor> windows_;
  capture::CaptureConfiguration::ListenerId config_listener_{0};
  bool suppress_callbacks_{false};
};

}  // namespace vantage::app
