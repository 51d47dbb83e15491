#pragma once

#include "color.hpp"
#include "sunarc/common/Optional.hpp"
#include <vector>

namespace sunarc {

struct ColorStop {
  double threshold;
  Color color;
};

/*
 * Piecewise-linear temperature -> color map over an ordered set of stops.
 *
 * Temperatures at or below the first threshold take the first stop's color, at or
 * above the last threshold the last stop's color. Between two adjacent stops each
 * channel is interpolated linearly and rounded to the nearest integer.
 */
class TemperatureGradient {
public:
  TemperatureGradient() = default;

  //  Null unless `stops` is non-empty with strictly ascending thresholds.
  static Optional<TemperatureGradient> create(std::vector<ColorStop> stops);

  //  Purple -> blue -> green -> yellow -> dark red, with the stops spread over
  //  [lo, hi] in the same proportions as the stock 20..90 F panel gradient.
  static TemperatureGradient make_default(double lo = 20.0, double hi = 90.0);

  Color evaluate(double temperature) const;

  const std::vector<ColorStop>& get_stops() const {
    return stops;
  }

private:
  std::vector<ColorStop> stops;
};

}
