#include "draw_plan.hpp"
#include "sunarc/common/common.hpp"
#include <algorithm>
#include <cassert>

SUNARC_NAMESPACE_BEGIN

const char* to_string(DrawInstructionType type) {
  switch (type) {
    case DrawInstructionType::SetPixel:
      return "SetPixel";
    case DrawInstructionType::Text:
      return "Text";
    case DrawInstructionType::Icon:
      return "Icon";
    case DrawInstructionType::RangeBar:
      return "RangeBar";
    case DrawInstructionType::ArcPoint:
      return "ArcPoint";
    case DrawInstructionType::GlowPoint:
      return "GlowPoint";
  }
  return "";
}

DrawInstruction& DrawPlan::push(DrawInstructionType type, int x, int y, const Color& color) {
  DrawInstruction instr{};
  instr.type = type;
  instr.x = x;
  instr.y = y;
  instr.color = color;
  instructions.push_back(instr);
  return instructions.back();
}

void DrawPlan::push_pixel(int x, int y, const Color& color) {
  push(DrawInstructionType::SetPixel, x, y, color);
}

void DrawPlan::push_text(int x, int y, const std::string& text, const Color& color, int scale) {
  auto& instr = push(DrawInstructionType::Text, x, y, color);
  instr.text.offset = uint32_t(text_data.size());
  instr.text.size = uint32_t(text.size());
  instr.text.scale = std::max(1, scale);
  text_data += text;
}

void DrawPlan::push_icon(int x, int y, IconId id) {
  auto& instr = push(DrawInstructionType::Icon, x, y, colors::white());
  instr.icon.id = id;
}

void DrawPlan::push_range_bar(int x, int top, int bottom, int width, int marker_y,
                              const Color& color) {
  auto& instr = push(DrawInstructionType::RangeBar, x, top, color);
  instr.range_bar.width = width;
  instr.range_bar.bottom = bottom;
  instr.range_bar.marker_y = marker_y;
}

void DrawPlan::push_arc_point(int x, int y, const Color& color) {
  push(DrawInstructionType::ArcPoint, x, y, color);
}

void DrawPlan::push_glow_point(int x, int y, const Color& color, float intensity, int radius) {
  auto& instr = push(DrawInstructionType::GlowPoint, x, y, color);
  instr.glow.intensity = intensity;
  instr.glow.radius = radius;
}

std::string DrawPlan::text_of(const DrawInstruction& instruction) const {
  if (instruction.type != DrawInstructionType::Text) {
    return {};
  }
  assert(instruction.text.offset + instruction.text.size <= text_data.size());
  return text_data.substr(instruction.text.offset, instruction.text.size);
}

int DrawPlan::count(DrawInstructionType type) const {
  return int(std::count_if(instructions.begin(), instructions.end(), [type](auto& instr) {
    return instr.type == type;
  }));
}

SUNARC_NAMESPACE_END
