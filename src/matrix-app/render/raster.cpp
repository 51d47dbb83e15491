#include "raster.hpp"
#include "draw_plan.hpp"
#include "font.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/load/image.hpp"
#include <cstring>

SUNARC_NAMESPACE_BEGIN

namespace {

struct Config {
  static constexpr float range_bar_brightness = 0.3f;
  static constexpr float glow_halo_brightness = 0.5f;
  static constexpr int placeholder_size = 8;
};

Color placeholder_color(IconId id) {
  switch (id) {
    case IconId::ClearDay:
      return Color::from_hex(0xffd200);
    case IconId::ClearNight:
      return Color::from_hex(0xb4c8ff);
    case IconId::PartlyCloudyDay:
      return Color::from_hex(0xe6d28c);
    case IconId::PartlyCloudyNight:
      return Color::from_hex(0x8c96b4);
    case IconId::Cloudy:
      return Color::from_hex(0x969696);
    case IconId::Rain:
      return Color::from_hex(0x2864ff);
    case IconId::Snow:
      return Color::from_hex(0xffffff);
    case IconId::Thunderstorm:
      return Color::from_hex(0xa03cdc);
    case IconId::Mist:
      return Color::from_hex(0x646e78);
    case IconId::Unknown:
      break;
  }
  return colors::white();
}

void draw_placeholder_icon(raster::Framebuffer& fb, int x, int y, IconId id) {
  const int tile = icons::AtlasLayout::tile_size;

  if (id == IconId::Unknown) {
    const int scale = 2;
    const int off_x = (tile - font::Metrics::glyph_width * scale) / 2;
    const int off_y = (tile - font::Metrics::glyph_height * scale) / 2;
    raster::draw_text(fb, x + off_x, y + off_y, "?", colors::white(), scale);
    return;
  }

  const int off = (tile - Config::placeholder_size) / 2;
  const auto color = placeholder_color(id);
  for (int i = 0; i < Config::placeholder_size; i++) {
    for (int j = 0; j < Config::placeholder_size; j++) {
      raster::set_pixel(fb, x + off + j, y + off + i, color);
    }
  }
}

bool blit_atlas_tile(raster::Framebuffer& fb, int x, int y, int tile_index, const IconAtlas& atlas) {
  const int tile = icons::AtlasLayout::tile_size;
  const int src_x0 = (tile_index % icons::AtlasLayout::num_columns) * tile;
  const int src_y0 = (tile_index / icons::AtlasLayout::num_columns) * tile;
  const auto& src = atlas.image;

  if (src.num_components_per_pixel < 3 ||
      !src.contains(src_x0, src_y0) ||
      !src.contains(src_x0 + tile - 1, src_y0 + tile - 1)) {
    return false;
  }

  for (int i = 0; i < tile; i++) {
    for (int j = 0; j < tile; j++) {
      const auto* px = src.ptr() + src.pixel_offset(src_x0 + j, src_y0 + i);
      Color color{px[0], px[1], px[2]};
      if (color != colors::black()) {
        raster::set_pixel(fb, x + j, y + i, color);
      }
    }
  }

  return true;
}

} //  anon

IconAtlas IconAtlas::load(const char* file_path, bool* success) {
  IconAtlas result;
  result.image = load_image(file_path, success, 3);
  return result;
}

raster::Framebuffer raster::make_framebuffer(int width, int height) {
  return Framebuffer::zeros(width, height, 3);
}

void raster::clear(Framebuffer& fb) {
  if (!fb.empty()) {
    std::memset(fb.ptr(), 0, fb.size());
  }
}

void raster::set_pixel(Framebuffer& fb, int x, int y, const Color& color) {
  if (!fb.contains(x, y)) {
    return;
  }
  auto* px = fb.ptr() + fb.pixel_offset(x, y);
  px[0] = color.r;
  px[1] = color.g;
  px[2] = color.b;
}

Color raster::get_pixel(const Framebuffer& fb, int x, int y) {
  if (!fb.contains(x, y)) {
    return colors::black();
  }
  const auto* px = fb.ptr() + fb.pixel_offset(x, y);
  return Color{px[0], px[1], px[2]};
}

void raster::draw_text(Framebuffer& fb, int x, int y, const std::string& text,
                       const Color& color, int scale) {
  int pen_x = x;

  for (uint32_t cp : font::decode_utf8(text)) {
    const uint8_t* rows = font::find_glyph(cp);
    if (!rows) {
      rows = font::find_glyph('?');
    }

    for (int row = 0; row < font::Metrics::glyph_height; row++) {
      for (int col = 0; col < font::Metrics::glyph_width; col++) {
        const bool on = (rows[row] >> (font::Metrics::glyph_width - 1 - col)) & 1u;
        if (!on) {
          continue;
        }
        for (int sy = 0; sy < scale; sy++) {
          for (int sx = 0; sx < scale; sx++) {
            set_pixel(fb, pen_x + col * scale + sx, y + row * scale + sy, color);
          }
        }
      }
    }

    pen_x += font::Metrics::advance * scale;
  }
}

void raster::draw_icon(Framebuffer& fb, int x, int y, IconId id, const IconAtlas* atlas) {
  const int tile_index = icons::atlas_tile_index(id);
  if (atlas && atlas->loaded() && tile_index >= 0 && blit_atlas_tile(fb, x, y, tile_index, *atlas)) {
    return;
  }
  draw_placeholder_icon(fb, x, y, id);
}

void raster::draw_range_bar(Framebuffer& fb, int x, int top, int bottom, int width, int marker_y,
                            const Color& color) {
  const auto bar_color = color.scaled(Config::range_bar_brightness);
  for (int yi = top; yi <= bottom; yi++) {
    const auto& c = yi == marker_y ? color : bar_color;
    for (int xi = 0; xi < width; xi++) {
      set_pixel(fb, x + xi, yi, c);
    }
  }
}

void raster::draw_glow(Framebuffer& fb, int x, int y, const Color& color, float intensity, int radius) {
  const auto halo = color.scaled(intensity * Config::glow_halo_brightness);
  for (int dy = -radius; dy <= radius; dy++) {
    for (int dx = -radius; dx <= radius; dx++) {
      if (dx != 0 || dy != 0) {
        set_pixel(fb, x + dx, y + dy, halo);
      }
    }
  }
  set_pixel(fb, x, y, color.scaled(intensity));
}

void raster::rasterize(const DrawPlan& plan, Framebuffer& fb, const IconAtlas* atlas) {
  clear(fb);

  for (auto& instr : plan) {
    switch (instr.type) {
      case DrawInstructionType::SetPixel:
      case DrawInstructionType::ArcPoint:
        set_pixel(fb, instr.x, instr.y, instr.color);
        break;
      case DrawInstructionType::Text:
        draw_text(fb, instr.x, instr.y, plan.text_of(instr), instr.color, instr.text.scale);
        break;
      case DrawInstructionType::Icon:
        draw_icon(fb, instr.x, instr.y, instr.icon.id, atlas);
        break;
      case DrawInstructionType::RangeBar:
        draw_range_bar(
          fb, instr.x, instr.y, instr.range_bar.bottom, instr.range_bar.width,
          instr.range_bar.marker_y, instr.color);
        break;
      case DrawInstructionType::GlowPoint:
        draw_glow(fb, instr.x, instr.y, instr.color, instr.glow.intensity, instr.glow.radius);
        break;
    }
  }
}

SUNARC_NAMESPACE_END
