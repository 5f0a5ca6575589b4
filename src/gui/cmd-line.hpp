#pragma once

#include "stdinc.hpp"

namespace fauna::gui
{
struct AppConfig
{
   bool show_help{false};
   bool has_error{false};

   int cpanel_form_label_min_width{100};

   string video_fname{""s};   // open on startup when set
   string dataset{""s};       // hdf5 dataset for `video_fname`
   string input_format{"channels_last"s};

   string to_string() const noexcept;
};

void show_help(string argv0);
AppConfig parse_command_line(int argc, char** argv) noexcept;

} // namespace fauna::gui
