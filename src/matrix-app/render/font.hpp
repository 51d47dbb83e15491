#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sunarc::font {

//  Fixed 3x5 pixel glyphs with one column of spacing.
struct Metrics {
  static constexpr int glyph_width = 3;
  static constexpr int glyph_height = 5;
  static constexpr int advance = 4;
};

//  Five rows, top to bottom; bit 2 of each row is the leftmost column. Null when
//  the code point has no glyph.
const uint8_t* find_glyph(uint32_t code_point);

//  Malformed sequences decode to U+FFFD.
std::vector<uint32_t> decode_utf8(const std::string& text);

int text_width(const std::string& text, int scale);

}
