#pragma once

// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "capture/picker_coordinator.hpp"

#include <gtkmm/box.h>
#include <gtkmm/button.h>
#include <gtkmm/checkbutton.h>
#include <gtkmm/label.h>
#include <gtkmm/listbox.h>
#include <gtkmm/window.h>

#include <functional>
#include <vector>

namespace vantage::app {

// In-app content picker. Lists displays and this application's windows;
// a click on a row completes the selection.
class PickerDialog : public Gtk::Window, public capture::PickerCoordinator {
 public:
  using SelectionHandler = std::function<void(const capture::PickerSelection&)>;

  explicit PickerDialog(SelectionHandler handler);

  void present() override;
  void set_active(bool active) override;

  // Which kinds of content the picker offers.
  void present_settings();

 private:
  void build_ui();
  void rebuild_rows();
  void on_row_activated(Gtk::ListBoxRow* row);

  SelectionHandler handler_;
  bool active_{false};
  bool allow_displays_{true};
  bool allow_windows_{true};

  Gtk::Box root_{Gtk::Orientation::VERTICAL};
  Gtk::Label heading_;
  Gtk::ListBox list_;
  Gtk::Box settings_box_{Gtk::Orientation::VERTICAL};
  Gtk::CheckButton allow_displays_check_{"Offer displays"};
  Gtk::CheckButton allow_windows_check_{"Offer windows"};
  Gtk::Button cancel_button_{"Cancel"};

  std::vector<capture::PickerSelection> row_selections_;
};

}  // namespace vantage::app
