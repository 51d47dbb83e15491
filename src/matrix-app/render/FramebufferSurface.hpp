#pragma once

#include "DrawingSurface.hpp"
#include "raster.hpp"
#include <string>
#include <vector>

namespace sunarc {

//  Receives each finished frame.
class FrameSink {
public:
  virtual ~FrameSink() = default;
  virtual void present(const raster::Framebuffer& frame) = 0;
};

/*
 * Rasterizes plans into an RGB framebuffer of the panel's size and forwards the
 * result to any attached sinks. The atlas and the sinks are not owned.
 */
class FramebufferSurface : public DrawingSurface {
public:
  FramebufferSurface(int width, int height, const IconAtlas* atlas);

  void render(const DrawPlan& plan) override;
  void add_sink(FrameSink* sink);

  const raster::Framebuffer& get_framebuffer() const {
    return framebuffer;
  }
  int get_num_frames_rendered() const {
    return num_frames_rendered;
  }

private:
  raster::Framebuffer framebuffer;
  const IconAtlas* atlas;
  std::vector<FrameSink*> sinks;
  int num_frames_rendered{};
};

//  Overwrites one PNG file with every frame.
class PngFrameSink : public FrameSink {
public:
  explicit PngFrameSink(std::string file_path);
  void present(const raster::Framebuffer& frame) override;

private:
  std::string file_path;
  bool reported_failure{};
};

//  Draws frames into a true-color terminal, two panel rows per text line.
class TerminalFrameSink : public FrameSink {
public:
  void present(const raster::Framebuffer& frame) override;
};

}
