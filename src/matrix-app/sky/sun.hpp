#pragma once

#include <cstdint>
#include <vector>

namespace sunarc {

//  Half-ellipse spanning `width` columns starting at `left`; its ends sit on
//  `baseline_y` and its apex is `height` pixels above.
struct SunArcGeometry {
  int left{42};
  int width{20};
  int baseline_y{30};
  int height{6};
};

struct PixelCoord {
  int x;
  int y;

  friend inline bool operator==(const PixelCoord& a, const PixelCoord& b) {
    return a.x == b.x && a.y == b.y;
  }
};

struct SunArc {
  double progress{};
  bool active{};
  double intensity{};
  PixelCoord point{};
};

namespace sun {

//  Fraction of the way from sunrise to sunset, clamped to [0, 1]. Sets `active` to
//  false and returns 0 when sunset does not come after sunrise.
double compute_progress(int64_t now, int64_t sunrise, int64_t sunset, bool* active);

//  sin(pi * p): 0 at either horizon, 1 at solar noon.
double glow_intensity(double progress);

PixelCoord arc_point(double progress, const SunArcGeometry& geometry);
SunArc compute_arc(int64_t now, int64_t sunrise, int64_t sunset, const SunArcGeometry& geometry);

//  One point per column, left to right.
std::vector<PixelCoord> arc_path(const SunArcGeometry& geometry);

bool is_night(int64_t now, int64_t sunrise, int64_t sunset);

}

}
