#include "sun.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/math/constants.hpp"
#include "sunarc/math/util.hpp"
#include <algorithm>
#include <cmath>

SUNARC_NAMESPACE_BEGIN

namespace {

double radius_x(const SunArcGeometry& geom) {
  return 0.5 * double(geom.width - 1);
}

double center_x(const SunArcGeometry& geom) {
  return double(geom.left) + radius_x(geom);
}

} //  anon

double sun::compute_progress(int64_t now, int64_t sunrise, int64_t sunset, bool* active) {
  if (sunset <= sunrise) {
    *active = false;
    return 0.0;
  }

  *active = true;
  auto p = (double(now) - double(sunrise)) / (double(sunset) - double(sunrise));
  return clamp01(p);
}

double sun::glow_intensity(double progress) {
  return std::max(0.0, std::sin(pi() * clamp01(progress)));
}

PixelCoord sun::arc_point(double progress, const SunArcGeometry& geom) {
  const auto theta = pi() * (1.0 - clamp01(progress));
  const auto x = center_x(geom) + radius_x(geom) * std::cos(theta);
  const auto y = double(geom.baseline_y) - double(geom.height) * std::sin(theta);
  return PixelCoord{int(std::round(x)), int(std::round(y))};
}

SunArc sun::compute_arc(int64_t now, int64_t sunrise, int64_t sunset, const SunArcGeometry& geom) {
  SunArc result{};
  result.progress = compute_progress(now, sunrise, sunset, &result.active);
  result.intensity = result.active ? glow_intensity(result.progress) : 0.0;
  result.point = arc_point(result.progress, geom);
  return result;
}

std::vector<PixelCoord> sun::arc_path(const SunArcGeometry& geom) {
  std::vector<PixelCoord> result;
  if (geom.width <= 0) {
    return result;
  }

  result.reserve(geom.width);
  const auto rx = radius_x(geom);
  const auto cx = center_x(geom);

  for (int i = 0; i < geom.width; i++) {
    const int x = geom.left + i;
    auto u = rx > 0.0 ? (double(x) - cx) / rx : 0.0;
    auto h = double(geom.height) * std::sqrt(std::max(0.0, 1.0 - u * u));
    result.push_back(PixelCoord{x, geom.baseline_y - int(std::round(h))});
  }

  return result;
}

bool sun::is_night(int64_t now, int64_t sunrise, int64_t sunset) {
  if (sunset <= sunrise) {
    return false;
  }
  return now < sunrise || now >= sunset;
}

SUNARC_NAMESPACE_END
