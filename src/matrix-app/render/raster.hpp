#pragma once

#include "color.hpp"
#include "icons.hpp"
#include "sunarc/visual/Image.hpp"
#include <cstdint>
#include <string>

namespace sunarc {

class DrawPlan;

//  Weather icon sprite sheet, stored as 3-component RGB.
struct IconAtlas {
  bool loaded() const {
    return !image.empty();
  }

  static IconAtlas load(const char* file_path, bool* success);

  Image<uint8_t> image;
};

namespace raster {

using Framebuffer = Image<uint8_t>;

Framebuffer make_framebuffer(int width, int height);
void clear(Framebuffer& fb);

//  Out-of-bounds writes are dropped.
void set_pixel(Framebuffer& fb, int x, int y, const Color& color);
Color get_pixel(const Framebuffer& fb, int x, int y);

void draw_text(Framebuffer& fb, int x, int y, const std::string& text, const Color& color, int scale);
//  Black atlas pixels are transparent. Without a usable tile a placeholder is drawn.
void draw_icon(Framebuffer& fb, int x, int y, IconId id, const IconAtlas* atlas);
void draw_range_bar(Framebuffer& fb, int x, int top, int bottom, int width, int marker_y,
                    const Color& color);
void draw_glow(Framebuffer& fb, int x, int y, const Color& color, float intensity, int radius);

//  Clear `fb`, then draw every instruction of `plan` in order.
void rasterize(const DrawPlan& plan, Framebuffer& fb, const IconAtlas* atlas);

}

}
