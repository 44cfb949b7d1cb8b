#include "app/picker_dialog.hpp"

#include "app/displays.hpp"
#include "vantage/log.hpp"

#include <gtkmm/separator.h>
#include <sigc++/sigc++.h>

namespace vantage::app {

PickerDialog::PickerDialog(SelectionHandler handler)
    : handler_(std::move(handler)) {
  set_title("Choose Content");
  set_default_size(420, 360);
  set_hide_on_close(true);
  set_modal(true);
  build_ui();
}

void PickerDialog::build_ui() {
  root_.set_spacing(8);
  root_.set_margin(12);
  set_child(root_);

  heading_.set_halign(Gtk::Align::START);
  heading_.add_css_class("dim-label");
  root_.append(heading_);

  list_.set_vexpand(true);
  list_.set_activate_on_single_click(true);
  list_.signal_row_activated().connect(
      sigc::mem_fun(*this, &PickerDialog::on_row_activated));
  root_.append(list_);

  settings_box_.set_spacing(4);
  allow_displays_check_.set_active(allow_displays_);
  allow_windows_check_.set_active(allow_windows_);
  allow_displays_check_.signal_toggled().connect([this]() {
    allow_displays_ = allow_displays_check_.get_active();
  });
  allow_windows_check_.signal_toggled().connect([this]() {
    allow_windows_ = allow_windows_check_.get_active();
  });
  settings_box_.append(allow_displays_check_);
  settings_box_.append(allow_windows_check_);
  root_.append(settings_box_);

  root_.append(*Gtk::make_managed<Gtk::Separator>(Gtk::Orientation::HORIZONTAL));
  cancel_button_.set_halign(Gtk::Align::END);
  cancel_button_.signal_clicked().connect([this]() { set_visible(false); });
  root_.append(cancel_button_);
}

void PickerDialog::present() {
  if (!active_) {
    vantage::log::warn("PickerDialog: present requested while inactive");
    return;
  }
  heading_.set_text("Select a display or window to capture");
  settings_box_.set_visible(false);
  list_.set_visible(true);
  rebuild_rows();
  Gtk::Window::present();
}

void PickerDialog::present_settings() {
  if (!active_) {
    return;
  }
  heading_.set_text("Picker configuration");
  list_.set_visible(false);
  settings_box_.set_visible(true);
  Gtk::Window::present();
}

void PickerDialog::set_active(bool active) {
  active_ = active;
  if (!active_) {
    set_visible(false);
  }
  vantage::log::debug("PickerDialog active", active_);
}

void PickerDialog::rebuild_rows() {
  while (auto* row = list_.get_row_at_index(0)) {
    list_.remove(*row);
  }
  row_selections_.clear();

  if (allow_displays_) {
    for (auto& display : enumerate_displays()) {
      auto* label = Gtk::make_managed<Gtk::Label>("Display: " + display.display_name());
      label->set_halign(Gtk::Align::START);
      list_.append(*label);
      row_selections_.push_back(capture::PickerSelection::of(std::move(display)));
    }
  }
  if (allow_windows_) {
    for (auto& window : enumerate_windows()) {
      auto* label = Gtk::make_managed<Gtk::Label>("Window: " + window.display_name());
      label->set_halign(Gtk::Align::START);
      list_.append(*label);
      row_selections_.push_back(capture::PickerSelection::of(std::move(window)));
    }
  }
}

void PickerDialog::on_row_activated(Gtk::ListBoxRow* row) {
  if (!row) {
    return;
  }
  const int index = row->get_index();
  if (index < 0 || static_cast<std::size_t>(index) >= row_selections_.size()) {
    return;
  }
  const auto selection = row_selections_[static_cast<std::size_t>(index)];
  set_visible(false);
  if (handler_) {
    handler_(selection);
  }
}

}  // namespace vantage::app
