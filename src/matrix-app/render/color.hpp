#pragma once

#include <cstdint>

namespace sunarc {

struct Color {
  static constexpr Color from_hex(uint32_t rgb) {
    return Color{uint8_t((rgb >> 16) & 0xff), uint8_t((rgb >> 8) & 0xff), uint8_t(rgb & 0xff)};
  }

  constexpr uint32_t to_hex() const {
    return (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b);
  }

  //  Multiply each channel by `s` in [0, 1].
  Color scaled(float s) const;

  uint8_t r;
  uint8_t g;
  uint8_t b;
};

inline bool operator==(const Color& a, const Color& b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b) {
  return !(a == b);
}

namespace colors {

constexpr Color black() {
  return Color{0, 0, 0};
}

constexpr Color white() {
  return Color{255, 255, 255};
}

}

}
