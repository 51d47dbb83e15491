#include "app_config.hpp"
#include "sunarc/common/common.hpp"
#include <cmath>

SUNARC_NAMESPACE_BEGIN

std::string validate(const AppConfig& config) {
  if (!std::isfinite(config.weather_update_interval_s) ||
      !std::isfinite(config.display_update_interval_s) ||
      !std::isfinite(config.tick_interval_s)) {
    return "intervals must be finite";
  } else if (!std::isfinite(config.gradient_temp_min) || !std::isfinite(config.gradient_temp_max)) {
    return "gradient bounds must be finite";
  } else if (!(config.weather_update_interval_s > 0.0)) {
    return "weather interval must be positive";
  } else if (!(config.display_update_interval_s > 0.0)) {
    return "display interval must be positive";
  } else if (!(config.tick_interval_s > 0.0)) {
    return "tick must be positive";
  } else if (config.display_width < 16 || config.display_height < 8) {
    return "panel must be at least 16x8";
  } else if (!(config.gradient_temp_min < config.gradient_temp_max)) {
    return "gradient minimum must be below its maximum";
  } else if (config.utc_offset_hours < -12 || config.utc_offset_hours > 14) {
    return "UTC offset must be within -12..14 hours";
  } else if (config.preview_window_scale < 1) {
    return "preview scale must be at least 1";
  } else if (config.max_num_ticks < 0) {
    return "tick count cannot be negative";
  } else if (!config.use_fixture_data && config.weather_file_path.empty()) {
    return "either --fake or --weather-file is required";
  }
  return {};
}

SUNARC_NAMESPACE_END
