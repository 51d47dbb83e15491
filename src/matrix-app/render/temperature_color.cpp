#include "temperature_color.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/math/util.hpp"
#include <cassert>

SUNARC_NAMESPACE_BEGIN

namespace {

struct Config {
  static constexpr double default_lo = 20.0;
  static constexpr double default_hi = 90.0;
};

//  Stock 20..90 F panel gradient.
const ColorStop default_stops[] = {
  {20.0, Color::from_hex(0x800080)},
  {35.0, Color::from_hex(0x0000ff)},
  {50.0, Color::from_hex(0x00ff00)},
  {70.0, Color::from_hex(0xffff00)},
  {90.0, Color::from_hex(0x800000)},
};

bool strictly_ascending(const std::vector<ColorStop>& stops) {
  for (size_t i = 1; i < stops.size(); i++) {
    if (!(stops[i - 1].threshold < stops[i].threshold)) {
      return false;
    }
  }
  return true;
}

Color interpolate(double t, const Color& a, const Color& b) {
  return Color{
    rounded_integer_lerp(t, a.r, b.r),
    rounded_integer_lerp(t, a.g, b.g),
    rounded_integer_lerp(t, a.b, b.b)
  };
}

} //  anon

Color Color::scaled(float s) const {
  s = clamp01(s);
  return Color{
    uint8_t(float(r) * s + 0.5f),
    uint8_t(float(g) * s + 0.5f),
    uint8_t(float(b) * s + 0.5f)
  };
}

Optional<TemperatureGradient> TemperatureGradient::create(std::vector<ColorStop> stops) {
  if (stops.empty() || !strictly_ascending(stops)) {
    return NullOpt{};
  }
  TemperatureGradient result;
  result.stops = std::move(stops);
  return Optional<TemperatureGradient>(std::move(result));
}

TemperatureGradient TemperatureGradient::make_default(double lo, double hi) {
  if (!(lo < hi)) {
    lo = Config::default_lo;
    hi = Config::default_hi;
  }

  const double scale = (hi - lo) / (Config::default_hi - Config::default_lo);
  std::vector<ColorStop> stops;
  for (auto& stop : default_stops) {
    auto threshold = lo + (stop.threshold - Config::default_lo) * scale;
    stops.push_back(ColorStop{threshold, stop.color});
  }

  auto res = create(std::move(stops));
  assert(res);
  return std::move(res.value());
}

Color TemperatureGradient::evaluate(double temperature) const {
  if (stops.empty()) {
    return colors::black();
  }

  if (temperature <= stops.front().threshold) {
    return stops.front().color;
  } else if (temperature >= stops.back().threshold) {
    return stops.back().color;
  }

  for (size_t i = 0; i + 1 < stops.size(); i++) {
    const auto& lo = stops[i];
    const auto& hi = stops[i + 1];
    if (temperature < hi.threshold) {
      auto t = (temperature - lo.threshold) / (hi.threshold - lo.threshold);
      return interpolate(t, lo.color, hi.color);
    }
  }

  return stops.back().color;
}

SUNARC_NAMESPACE_END
