#pragma once

#include <string>

namespace sunarc {

/*
 * Process-wide settings, fixed once the command line has been parsed.
 */
struct AppConfig {
  double weather_update_interval_s{300.0};
  double display_update_interval_s{60.0};
  int utc_offset_hours{-5};
  int display_width{64};
  int display_height{32};
  double gradient_temp_min{20.0};
  double gradient_temp_max{90.0};
  bool use_fixture_data{};
  bool use_24_hour_clock{};
  std::string weather_file_path;
  std::string icon_atlas_path;
  std::string frame_output_path;
  bool show_preview_window{};
  bool show_terminal_preview{};
  int preview_window_scale{12};
  double tick_interval_s{1.0};
  int max_num_ticks{};
  bool quiet{};

  int utc_offset_seconds() const {
    return utc_offset_hours * 3600;
  }
};

//  Empty when `config` is usable, otherwise a description of the first problem.
std::string validate(const AppConfig& config);

}
