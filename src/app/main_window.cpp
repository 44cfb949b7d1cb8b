#include "app/main_window.hpp"

#include "app/displays.hpp"
#include "vantage/log.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <giomm/appinfo.h>
#include <glibmm/convert.h>
#include <glibmm/main.h>
#include <gtkmm/separator.h>
#include <iomanip>
#include <sigc++/sigc++.h>
#include <sstream>
#include <system_error>

namespace vantage::app {

namespace {

std::string format_elapsed(double milliseconds) {
  const auto total = static_cast<long long>(milliseconds / 1000.0);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << (total / 60) << ':'
      << std::setw(2) << (total % 60);
  return oss.str();
}

}  // namespace

MainWindow::MainWindow()
    : Gtk::ApplicationWindow(),
      picker_([this](const capture::PickerSelection& selection) {
        on_picker_selection(selection);
      }) {
  set_title("Vantage");
  set_default_size(460, 820);

  header_bar_ = Gtk::make_managed<Gtk::HeaderBar>();
  header_bar_->set_show_title_buttons(true);
  set_titlebar(*header_bar_);

  vantage::log::set_level(settings_.data().log_level);
  vantage::log::apply_environment();
  settings_.apply_to(config_);

  picker_.set_transient_for(*this);
  controller_ = std::make_unique<capture::CaptureSessionController>(
      config_, backend_, app_audio_, picker_);
  controller_->connect_running_changed([this](bool) {
    Glib::signal_idle().connect_once(
        sigc::mem_fun(*this, &MainWindow::update_session_ui));
  });
  config_listener_ = config_.subscribe(
      [this](capture::ConfigField field) { on_config_changed(field); });

  build_ui();
  refresh_targets();
  sync_from_config();
  update_session_ui();

  add_tick_callback(sigc::mem_fun(*this, &MainWindow::on_frame_tick));

  display_monitor_ = std::make_unique<capture::DisplayMonitor>([this]() {
    Glib::signal_idle().connect_once(
        sigc::mem_fun(*this, &MainWindow::refresh_targets));
  });
}

MainWindow::~MainWindow() {
  display_monitor_.reset();
  config_.unsubscribe(config_listener_);
  controller_.reset();
  app_audio_.stop();
}

Gtk::Label* MainWindow::append_header(const char* title) {
  auto* label = Gtk::make_managed<Gtk::Label>(title);
  label->set_halign(Gtk::Align::START);
  label->add_css_class("heading");
  label->add_css_class("dim-label");
  label->set_margin_top(12);
  form_.append(*label);
  return label;
}

void MainWindow::build_ui() {
  root_.set_spacing(12);
  root_.set_margin(12);
  set_child(root_);

  form_.set_spacing(6);
  form_.set_vexpand(true);
  root_.append(form_);

  append_header("Video");
  auto* type_label = Gtk::make_managed<Gtk::Label>("Capture Type");
  type_label->set_halign(Gtk::Align::START);
  form_.append(*type_label);
  capture_type_combo_.append("display", "Display");
  capture_type_combo_.append("window", "Window");
  form_.append(capture_type_combo_);

  auto* content_label = Gtk::make_managed<Gtk::Label>("Screen Content");
  content_label->set_halign(Gtk::Align::START);
  form_.append(*content_label);
  form_.append(target_combo_);

  auto* hdr_label = Gtk::make_managed<Gtk::Label>("Display HDR");
  hdr_label->set_halign(Gtk::Align::START);
  form_.append(*hdr_label);
  preset_combo_.append("", capture::preset_label(std::nullopt));
  for (const auto preset : capture::all_dynamic_range_presets()) {
    const std::string name(capture::to_string(preset));
    preset_combo_.append(name, name);
  }
  form_.append(preset_combo_);
  form_.append(exclude_app_check_);

  append_header("Audio");
  form_.append(mic_check_);
  form_.append(audio_check_);
  form_.append(exclude_app_audio_check_);
  audio_level_bar_.set_min_value(0.0);
  audio_level_bar_.set_max_value(1.0);
  audio_level_bar_.set_value(0.0);
  form_.append(audio_level_bar_);
  play_audio_button_.set_halign(Gtk::Align::START);
  form_.append(play_audio_button_);

  append_header("Content Picker");
  form_.append(picker_active_check_);
  picker_settings_button_.set_halign(Gtk::Align::START);
  present_picker_button_.set_halign(Gtk::Align::START);
  form_.append(picker_settings_button_);
  form_.append(present_picker_button_);

  append_header("Record and Save Output");
  recording_row_.set_spacing(8);
  recording_row_.append(recording_check_);
  recording_indicator_.set_text("●");
  recording_indicator_.add_css_class("error");
  recording_row_.append(recording_indicator_);
  form_.append(recording_row_);
  view_recordings_button_.set_halign(Gtk::Align::START);
  form_.append(view_recordings_button_);

  root_.append(*Gtk::make_managed<Gtk::Separator>(Gtk::Orientation::HORIZONTAL));

  button_row_.set_spacing(12);
  button_row_.set_halign(Gtk::Align::CENTER);
  button_row_.append(start_button_);
  button_row_.append(stop_button_);
  root_.append(button_row_);

  status_label_.set_halign(Gtk::Align::CENTER);
  status_label_.add_css_class("dim-label");
  root_.append(status_label_);

  capture_type_combo_.signal_changed().connect(
      sigc::mem_fun(*this, &MainWindow::on_capture_type_changed));
  target_combo_.signal_changed().connect(
      sigc::mem_fun(*this, &MainWindow::on_target_changed));
  preset_combo_.signal_changed().connect(
      sigc::mem_fun(*this, &MainWindow::on_preset_changed));

  exclude_app_check_.signal_toggled().connect([this]() {
    if (suppress_callbacks_) {
      return;
    }
    if (!config_.set_app_excluded(exclude_app_check_.get_active())) {
      sync_from_config();
    }
  });
  mic_check_.signal_toggled().connect([this]() {
    if (!suppress_callbacks_) {
      config_.set_mic_capture_enabled(mic_check_.get_active());
    }
  });
  audio_check_.signal_toggled().connect([this]() {
    if (!suppress_callbacks_) {
      config_.set_audio_capture_enabled(audio_check_.get_active());
    }
  });
  exclude_app_audio_check_.signal_toggled().connect([this]() {
    if (!suppress_callbacks_) {
      config_.set_app_audio_excluded(exclude_app_audio_check_.get_active());
    }
  });
  picker_active_check_.signal_toggled().connect([this]() {
    if (!suppress_callbacks_) {
      config_.set_picker_active(picker_active_check_.get_active());
    }
  });
  recording_check_.signal_toggled().connect([this]() {
    if (!suppress_callbacks_) {
      config_.set_recording_stream(recording_check_.get_active());
    }
  });

  play_audio_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &MainWindow::on_play_audio_clicked));
  picker_settings_button_.signal_clicked().connect(
      [this]() { picker_.present_settings(); });
  present_picker_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &MainWindow::on_present_picker_clicked));
  view_recordings_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &MainWindow::on_view_recordings_clicked));
  start_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &MainWindow::on_start_clicked));
  stop_button_.signal_clicked().connect(
      sigc::mem_fun(*this, &MainWindow::on_stop_clicked));
}

void MainWindow::refresh_targets() {
  displays_ = enumerate_displays();
  windows_ = enumerate_windows();
  vantage::log::debug("Targets refreshed:", displays_.size(), "displays",
                      windows_.size(), "windows");
  populate_target_combo();
}

void MainWindow::populate_target_combo() {
  suppress_callbacks_ = true;
  target_combo_.remove_all();
  if (config_.capture_type() == capture::CaptureType::Display) {
    for (const auto& display : displays_) {
      target_combo_.append(std::to_string(display.id), display.display_name());
    }
    if (const auto& selected = config_.selected_display()) {
      target_combo_.set_active_id(std::to_string(selected->id));
    }
  } else {
    for (const auto& window : windows_) {
      target_combo_.append(std::to_string(window.id), window.display_name());
    }
    if (const auto& selected = config_.selected_window()) {
      target_combo_.set_active_id(std::to_string(selected->id));
    }
  }
  suppress_callbacks_ = false;

  if (config_.capture_type() == capture::CaptureType::Display) {
    if (!config_.selected_display() && !displays_.empty()) {
      config_.set_selected_display(displays_.front());
    }
  } else if (!config_.selected_window() && !windows_.empty()) {
    config_.set_selected_window(windows_.front());
  }
}

void MainWindow::sync_from_config() {
  suppress_callbacks_ = true;
  capture_type_combo_.set_active_id(
      std::string(capture::to_string(config_.capture_type())));
  if (config_.capture_type() == capture::CaptureType::Display &&
      config_.selected_display()) {
    target_combo_.set_active_id(std::to_string(config_.selected_display()->id));
  } else if (config_.capture_type() == capture::CaptureType::Window &&
             config_.selected_window()) {
    target_combo_.set_active_id(std::to_string(config_.selected_window()->id));
  }
  const auto& preset = config_.dynamic_range_preset();
  preset_combo_.set_active_id(preset ? std::string(capture::to_string(*preset))
                                     : std::string());

  exclude_app_check_.set_active(config_.app_excluded());
  exclude_app_check_.set_sensitive(config_.can_toggle_app_exclusion());
  mic_check_.set_active(config_.mic_capture_enabled());
  audio_check_.set_active(config_.audio_capture_enabled());
  exclude_app_audio_check_.set_active(config_.app_audio_excluded());
  exclude_app_audio_check_.set_sensitive(config_.can_toggle_app_audio_exclusion());
  play_audio_button_.set_sensitive(config_.can_play_app_audio());

  picker_active_check_.set_active(config_.picker_active());
  picker_settings_button_.set_sensitive(config_.can_configure_picker());
  present_picker_button_.set_sensitive(config_.can_present_picker());

  recording_check_.set_active(config_.recording_stream());
  recording_indicator_.set_visible(config_.recording_stream());
  suppress_callbacks_ = false;
}

void MainWindow::update_session_ui() {
  if (!controller_) {
    return;
  }
  const bool running = controller_->is_running();
  start_button_.set_sensitive(!running);
  stop_button_.set_sensitive(running);

  const auto error = controller_->last_error();
  if (running) {
    status_label_.set_text("Capturing");
  } else if (!error) {
    status_label_.set_text(error.message());
  } else {
    status_label_.set_text("Stopped");
  }
}

bool MainWindow::on_frame_tick(const Glib::RefPtr<Gdk::FrameClock>& clock) {
  (void)clock;
  const double level = level_meter_.update(app_audio_.level());
  audio_level_bar_.set_value(level);
  if (app_audio_.is_playing()) {
    std::ostringstream db;
    db << std::fixed << std::setprecision(1)
       << audio::LevelMeter::to_dbfs(level) << " dBFS";
    audio_level_bar_.set_tooltip_text(db.str());
  }
  play_audio_button_.set_label(app_audio_.is_playing() ? "Stop App Audio"
                                                       : "Play App Audio");

  if (controller_ && controller_->is_running()) {
    std::string text = "Capturing " + format_elapsed(controller_->session_elapsed_ms());
    if (config_.recording_stream()) {
      if (const auto path = backend_.output_path()) {
        text += " to " + path->filename().string();
      }
    }
    status_label_.set_text(text);
  }
  return true;
}

void MainWindow::on_config_changed(capture::ConfigField field) {
  settings_.update_from(config_);
  if (field == capture::ConfigField::CaptureType) {
    populate_target_combo();
  }
  sync_from_config();
}

void MainWindow::on_capture_type_changed() {
  if (suppress_callbacks_) {
    return;
  }
  if (const auto type = capture::parse_capture_type(
          capture_type_combo_.get_active_id().raw())) {
    config_.set_capture_type(*type);
  }
}

void MainWindow::on_target_changed() {
  if (suppress_callbacks_) {
    return;
  }
  const auto id = target_combo_.get_active_id().raw();
  if (id.empty()) {
    return;
  }
  if (config_.capture_type() == capture::CaptureType::Display) {
    const auto it = std::find_if(displays_.begin(), displays_.end(),
                                 [&](const capture::DisplayDescriptor& display) {
                                   return std::to_string(display.id) == id;
                                 });
    if (it != displays_.end()) {
      config_.set_selected_display(*it);
    }
  } else {
    const auto it = std::find_if(windows_.begin(), windows_.end(),
                                 [&](const capture::WindowDescriptor& window) {
                                   return std::to_string(window.id) == id;
                                 });
    if (it != windows_.end()) {
      config_.set_selected_window(*it);
    }
  }
}

void MainWindow::on_preset_changed() {
  if (suppress_callbacks_) {
    return;
  }
  const auto id = preset_combo_.get_active_id().raw();
  config_.set_dynamic_range_preset(capture::parse_dynamic_range_preset(id));
}

void MainWindow::on_start_clicked() {
  report_start_result(controller_->start().share());
  update_session_ui();
}

void MainWindow::on_stop_clicked() {
  controller_->stop();
  update_session_ui();
}

void MainWindow::on_present_picker_clicked() {
  const auto status = controller_->present_picker();
  if (!status) {
    status_label_.set_text(status.message());
  }
}

void MainWindow::on_play_audio_clicked() {
  const bool playing = controller_->toggle_app_audio();
  vantage::log::debug("App audio playing", playing);
}

void MainWindow::on_view_recordings_clicked() {
  const auto directory = config_.recording_directory();
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    vantage::log::warn("Unable to create recordings folder", directory.string(),
                       ec.message());
    return;
  }
  try {
    Gio::AppInfo::launch_default_for_uri(Glib::filename_to_uri(directory.string()));
  } catch (const Glib::Error& ex) {
    vantage::log::warn("Unable to open recordings folder", ex.what());
  }
}

void MainWindow::on_picker_selection(const capture::PickerSelection& selection) {
  report_start_result(controller_->on_picker_update(selection).share());
  update_session_ui();
}

void MainWindow::report_start_result(std::shared_future<capture::Status> result) {
  // Tracked so the poll is dropped if the window goes away first.
  Glib::signal_timeout().connect(
      sigc::track_obj(
          [this, result]() {
            if (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
              return true;
            }
            const auto& status = result.get();
            if (!status) {
              status_label_.set_text(status.message());
            }
            update_session_ui();
            return false;
          },
          *this),
      50);
}

}  // namespace vantage::app
