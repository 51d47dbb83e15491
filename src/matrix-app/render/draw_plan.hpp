#pragma once

#include "color.hpp"
#include "icons.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sunarc {

enum class DrawInstructionType : uint8_t {
  SetPixel = 0,
  Text,
  Icon,
  RangeBar,
  ArcPoint,
  GlowPoint
};

const char* to_string(DrawInstructionType type);

struct TextDescriptor {
  uint32_t offset;
  uint32_t size;
  int scale;
};

struct IconDescriptor {
  IconId id;
};

//  A vertical bar from (x, y) down to (x + width - 1, bottom). `marker_y` is the row
//  that stands for the current temperature.
struct RangeBarDescriptor {
  int width;
  int bottom;
  int marker_y;
};

struct GlowDescriptor {
  float intensity;
  int radius;
};

/*
 * One primitive. `x`, `y` are the anchor (top-left for text and icons, the pixel
 * itself for points). `color` is unused for icons.
 */
struct DrawInstruction {
  DrawInstructionType type;
  int x;
  int y;
  Color color;
  union {
    TextDescriptor text;
    IconDescriptor icon;
    RangeBarDescriptor range_bar;
    GlowDescriptor glow;
  };
};

/*
 * Ordered sequence of draw instructions for one frame; later instructions paint
 * over earlier ones. Text is stored in a single buffer owned by the plan.
 */
class DrawPlan {
public:
  void push_pixel(int x, int y, const Color& color);
  void push_text(int x, int y, const std::string& text, const Color& color, int scale = 1);
  void push_icon(int x, int y, IconId id);
  void push_range_bar(int x, int top, int bottom, int width, int marker_y, const Color& color);
  void push_arc_point(int x, int y, const Color& color);
  void push_glow_point(int x, int y, const Color& color, float intensity, int radius);

  std::string text_of(const DrawInstruction& instruction) const;

  size_t size() const {
    return instructions.size();
  }
  bool empty() const {
    return instructions.empty();
  }
  const DrawInstruction& operator[](size_t i) const {
    return instructions[i];
  }
  std::vector<DrawInstruction>::const_iterator begin() const {
    return instructions.begin();
  }
  std::vector<DrawInstruction>::const_iterator end() const {
    return instructions.end();
  }

  int count(DrawInstructionType type) const;

private:
  DrawInstruction& push(DrawInstructionType type, int x, int y, const Color& color);

private:
  std::vector<DrawInstruction> instructions;
  std::string text_data;
};

}
