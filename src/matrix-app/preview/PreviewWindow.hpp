#pragma once

#include "glfw.hpp"
#include "../render/FramebufferSurface.hpp"
#include "sunarc/common/common.hpp"
#include <string>

namespace sunarc {

/*
 * Desktop stand-in for the LED panel: every panel pixel becomes a round dot of
 * `scale` window pixels. Escape closes the window.
 */
class PreviewWindow : public FrameSink {
public:
  PreviewWindow() = default;
  ~PreviewWindow() override;
  SUNARC_DELETE_COPY_CTOR_AND_ASSIGNMENT(PreviewWindow)

  //  Returns an error message on failure.
  std::string open(int panel_width, int panel_height, int scale);
  void close();

  void present(const raster::Framebuffer& frame) override;
  void poll_events();
  bool should_close() const;

private:
  void draw(const raster::Framebuffer& frame);

private:
  preview::GLFWContext context;
  int scale{1};
};

}
