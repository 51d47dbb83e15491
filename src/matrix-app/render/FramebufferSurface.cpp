#include "FramebufferSurface.hpp"
#include "draw_plan.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/common/logging.hpp"
#include "sunarc/load/image.hpp"
#include <iostream>
#include <sstream>

SUNARC_NAMESPACE_BEGIN

namespace {

[[maybe_unused]] constexpr const char* logging_id() {
  return "FramebufferSurface";
}

void append_rgb(std::ostringstream& out, int code, const Color& c) {
  out << "\x1b[" << code << ";2;" << int(c.r) << ";" << int(c.g) << ";" << int(c.b) << "m";
}

} //  anon

FramebufferSurface::FramebufferSurface(int width, int height, const IconAtlas* atlas) :
  framebuffer{raster::make_framebuffer(width, height)},
  atlas{atlas} {
  //
}

void FramebufferSurface::render(const DrawPlan& plan) {
  raster::rasterize(plan, framebuffer, atlas);
  num_frames_rendered++;

  for (auto* sink : sinks) {
    sink->present(framebuffer);
  }
}

void FramebufferSurface::add_sink(FrameSink* sink) {
  sinks.push_back(sink);
}

PngFrameSink::PngFrameSink(std::string file_path) : file_path{std::move(file_path)} {
  //
}

void PngFrameSink::present(const raster::Framebuffer& frame) {
  bool ok = write_image(
    frame.ptr(), frame.width, frame.height, frame.num_components_per_pixel, file_path.c_str());

  //  Report once per failure streak rather than on every frame.
  if (!ok && !reported_failure) {
    std::string msg{"Failed to write frame to "};
    msg += file_path;
    SUNARC_LOG_WARNING_CAPTURE_META(msg.c_str(), logging_id());
  }
  reported_failure = !ok;
}

void TerminalFrameSink::present(const raster::Framebuffer& frame) {
  std::ostringstream out;
  out << "\x1b[H";

  for (int y = 0; y < frame.height; y += 2) {
    for (int x = 0; x < frame.width; x++) {
      append_rgb(out, 38, raster::get_pixel(frame, x, y));
      append_rgb(out, 48, raster::get_pixel(frame, x, y + 1));
      out << "\xE2\x96\x80";  //  upper half block
    }
    out << "\x1b[0m\n";
  }

  std::cout << out.str() << std::flush;
}

SUNARC_NAMESPACE_END
