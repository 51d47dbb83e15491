#include "compose.hpp"
#include "icons.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/math/util.hpp"
#include <cmath>
#include <cstdio>

SUNARC_NAMESPACE_BEGIN

namespace {

struct Config {
  static constexpr float min_glow_brightness = 0.35f;
  static constexpr int glow_radius = 1;
  static constexpr uint32_t arc_color = 0x444444;
  static constexpr uint32_t sun_color = 0xffaa00;
  static constexpr uint32_t text_color = 0xffffff;
};

} //  anon

DisplayLayout DisplayLayout::for_display(int width, int height) {
  DisplayLayout result{};
  result.width = width;
  result.height = height;
  result.text_scale = height >= 32 ? 2 : 1;
  result.clock_anchor = PixelCoord{2, 2};
  result.icon_anchor = PixelCoord{width - 18, 0};
  result.temperature_anchor = PixelCoord{6, height / 2 + 2};
  result.loading_anchor = PixelCoord{2, height / 2 - 3};
  result.range_bar_x = 2;
  result.range_bar_top = height / 2 + 2;
  result.range_bar_bottom = height - 3;
  result.range_bar_width = 2;
  result.sun_arc.left = width - 22;
  result.sun_arc.width = 20;
  result.sun_arc.baseline_y = height - 2;
  result.sun_arc.height = 6;
  return result;
}

std::string compose::format_clock(const ClockState& clock, bool use_24_hour_clock) {
  int hour = clock.hour();
  if (!use_24_hour_clock) {
    hour = hour % 12;
    hour = hour == 0 ? 12 : hour;
  }
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", hour, clock.minute());
  return std::string{buffer};
}

std::string compose::format_temperature(int degrees_f) {
  //  UTF-8 degree sign.
  return std::to_string(degrees_f) + "\xC2\xB0" "F";
}

int compose::range_bar_marker_y(int temperature, const weather::DailyRange& range,
                                int top, int bottom) {
  auto frac = inv_lerp_clamped(double(temperature), double(range.min), double(range.max));
  auto y = bottom - int(std::round(frac * double(bottom - top)));
  return clamp(y, top, bottom);
}

DrawPlan compose_display(const Optional<weather::Reading>& maybe_reading,
                         const ClockState& clock,
                         const ComposeParams& params) {
  DrawPlan plan;
  const auto& layout = params.layout;
  const auto text_color = Color::from_hex(Config::text_color);

  if (!maybe_reading) {
    plan.push_text(
      layout.loading_anchor.x, layout.loading_anchor.y, compose::loading_text(), text_color, 1);
    return plan;
  }

  const auto& reading = maybe_reading.value();
  const auto now = clock.epoch_seconds;
  const bool night = sun::is_night(now, reading.sunrise(), reading.sunset());

  plan.push_icon(
    layout.icon_anchor.x, layout.icon_anchor.y, select_icon(reading.condition(), night));

  const auto temp_color = params.gradient.evaluate(double(reading.temperature()));
  plan.push_text(
    layout.temperature_anchor.x,
    layout.temperature_anchor.y,
    compose::format_temperature(reading.temperature()),
    temp_color,
    layout.text_scale);

  if (reading.daily()) {
    auto marker_y = compose::range_bar_marker_y(
      reading.temperature(), reading.daily().value(),
      layout.range_bar_top, layout.range_bar_bottom);
    plan.push_range_bar(
      layout.range_bar_x, layout.range_bar_top, layout.range_bar_bottom,
      layout.range_bar_width, marker_y, temp_color);
  }

  const auto arc_color = Color::from_hex(Config::arc_color);
  for (auto& p : sun::arc_path(layout.sun_arc)) {
    plan.push_arc_point(p.x, p.y, arc_color);
  }

  auto arc = sun::compute_arc(now, reading.sunrise(), reading.sunset(), layout.sun_arc);
  if (arc.active && !night) {
    auto brightness = lerp(float(arc.intensity), Config::min_glow_brightness, 1.0f);
    plan.push_glow_point(
      arc.point.x, arc.point.y, Color::from_hex(Config::sun_color), brightness, Config::glow_radius);
  }

  plan.push_text(
    layout.clock_anchor.x,
    layout.clock_anchor.y,
    compose::format_clock(clock, params.use_24_hour_clock),
    text_color,
    layout.text_scale);

  return plan;
}

SUNARC_NAMESPACE_END
