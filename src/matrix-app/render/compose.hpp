#pragma once

#include "draw_plan.hpp"
#include "temperature_color.hpp"
#include "../sky/sun.hpp"
#include "../time/clock.hpp"
#include "../weather/common.hpp"
#include "sunarc/common/Optional.hpp"
#include <string>

namespace sunarc {

struct DisplayLayout {
  //  Layout of the 64x32 panel, with right / bottom anchored elements moved to
  //  follow other panel sizes.
  static DisplayLayout for_display(int width, int height);

  int width;
  int height;
  int text_scale;
  PixelCoord clock_anchor;
  PixelCoord icon_anchor;
  PixelCoord temperature_anchor;
  PixelCoord loading_anchor;
  int range_bar_x;
  int range_bar_top;
  int range_bar_bottom;
  int range_bar_width;
  SunArcGeometry sun_arc;
};

struct ComposeParams {
  DisplayLayout layout{DisplayLayout::for_display(64, 32)};
  TemperatureGradient gradient{TemperatureGradient::make_default()};
  bool use_24_hour_clock{};
};

namespace compose {

constexpr const char* loading_text() {
  return "Loading...";
}

std::string format_clock(const ClockState& clock, bool use_24_hour_clock);
std::string format_temperature(int degrees_f);

//  Row of the range bar standing for `temperature`: `bottom` at the daily minimum,
//  `top` at the maximum, clamped in between.
int range_bar_marker_y(int temperature, const weather::DailyRange& range, int top, int bottom);

}

/*
 * Build the frame for `reading` at time `clock`. Without a reading the plan holds a
 * single "Loading..." text instruction. Otherwise, in draw order: weather icon,
 * temperature text, daily range bar (if the range is known), sun arc path, sun glow
 * (daytime with valid sun times only), clock text.
 */
DrawPlan compose_display(const Optional<weather::Reading>& reading,
                         const ClockState& clock,
                         const ComposeParams& params);

}
