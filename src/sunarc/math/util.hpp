#pragma once

#include "constants.hpp"
#include <cmath>

namespace sunarc {

template <typename T>
const T& clamp(const T& value, const T& lo, const T& hi) {
  if (value < lo) {
    return lo;
  } else if (value > hi) {
    return hi;
  } else {
    return value;
  }
}

template <typename T>
T clamp01(const T& value) {
  return clamp(value, T(0), T(1));
}

template <typename T, typename U>
inline T lerp(U frac, const T& a, const T& b) {
  return (U(1) - frac) * a + frac * b;
}

//  Position of `v` in [lo, hi] as a fraction in [0, 1]; 0 when the interval is empty.
template <typename T>
inline T inv_lerp_clamped(const T& v, const T& lo, const T& hi) {
  return lo >= hi ? T(0) : (clamp(v, lo, hi) - lo) / (hi - lo);
}

template <typename Int, typename Float>
inline Int rounded_integer_lerp(Float frac, const Int& a, const Int& b) {
  auto res = Float(b - a) * frac + Float(a);
  return Int(std::round(res));
}

}
