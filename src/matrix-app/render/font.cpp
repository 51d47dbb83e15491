#include "font.hpp"
#include "sunarc/common/common.hpp"

SUNARC_NAMESPACE_BEGIN

namespace {

struct Glyph {
  uint32_t code_point;
  uint8_t rows[font::Metrics::glyph_height];
};

constexpr uint32_t replacement_character = 0xfffd;

const Glyph glyphs[] = {
  {' ', {0b000, 0b000, 0b000, 0b000, 0b000}},
  {'0', {0b111, 0b101, 0b101, 0b101, 0b111}},
  {'1', {0b010, 0b110, 0b010, 0b010, 0b111}},
  {'2', {0b111, 0b001, 0b111, 0b100, 0b111}},
  {'3', {0b111, 0b001, 0b111, 0b001, 0b111}},
  {'4', {0b101, 0b101, 0b111, 0b001, 0b001}},
  {'5', {0b111, 0b100, 0b111, 0b001, 0b111}},
  {'6', {0b111, 0b100, 0b111, 0b101, 0b111}},
  {'7', {0b111, 0b001, 0b001, 0b010, 0b010}},
  {'8', {0b111, 0b101, 0b111, 0b101, 0b111}},
  {'9', {0b111, 0b101, 0b111, 0b001, 0b111}},
  {':', {0b000, 0b010, 0b000, 0b010, 0b000}},
  {'-', {0b000, 0b000, 0b111, 0b000, 0b000}},
  {'.', {0b000, 0b000, 0b000, 0b000, 0b010}},
  {'?', {0b111, 0b001, 0b010, 0b000, 0b010}},
  {'C', {0b111, 0b100, 0b100, 0b100, 0b111}},
  {'F', {0b111, 0b100, 0b110, 0b100, 0b100}},
  {'L', {0b100, 0b100, 0b100, 0b100, 0b111}},
  {'a', {0b000, 0b011, 0b101, 0b101, 0b011}},
  {'d', {0b001, 0b001, 0b011, 0b101, 0b011}},
  {'g', {0b011, 0b101, 0b011, 0b001, 0b110}},
  {'i', {0b010, 0b000, 0b010, 0b010, 0b010}},
  {'n', {0b000, 0b110, 0b101, 0b101, 0b101}},
  {'o', {0b000, 0b010, 0b101, 0b101, 0b010}},
  {0x00b0, {0b010, 0b101, 0b010, 0b000, 0b000}},  //  degree sign
};

} //  anon

const uint8_t* font::find_glyph(uint32_t code_point) {
  for (auto& glyph : glyphs) {
    if (glyph.code_point == code_point) {
      return glyph.rows;
    }
  }
  return nullptr;
}

std::vector<uint32_t> font::decode_utf8(const std::string& text) {
  std::vector<uint32_t> result;
  size_t i = 0;

  while (i < text.size()) {
    const auto lead = uint8_t(text[i]);
    int num_continuation;
    uint32_t cp;

    if (lead < 0x80) {
      num_continuation = 0;
      cp = lead;
    } else if ((lead & 0xe0) == 0xc0) {
      num_continuation = 1;
      cp = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
      num_continuation = 2;
      cp = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
      num_continuation = 3;
      cp = lead & 0x07;
    } else {
      result.push_back(replacement_character);
      i++;
      continue;
    }

    bool ok = i + num_continuation < text.size();
    for (int j = 1; ok && j <= num_continuation; j++) {
      const auto cont = uint8_t(text[i + j]);
      if ((cont & 0xc0) != 0x80) {
        ok = false;
      } else {
        cp = (cp << 6) | (cont & 0x3f);
      }
    }

    if (ok) {
      result.push_back(cp);
      i += 1 + num_continuation;
    } else {
      result.push_back(replacement_character);
      i++;
    }
  }

  return result;
}

int font::text_width(const std::string& text, int scale) {
  const int n = int(decode_utf8(text).size());
  return n == 0 ? 0 : (n * Metrics::advance - 1) * scale;
}

SUNARC_NAMESPACE_END
