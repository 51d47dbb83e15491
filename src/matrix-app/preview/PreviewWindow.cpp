#include "PreviewWindow.hpp"
#include "sunarc/common/logging.hpp"
#include <GLFW/glfw3.h>
#include <algorithm>

SUNARC_NAMESPACE_BEGIN

namespace {

[[maybe_unused]] constexpr const char* logging_id() {
  return "PreviewWindow";
}

struct Config {
  static constexpr float dot_fill = 0.8f;
  static constexpr float unlit_level = 0.06f;
};

void key_callback(GLFWwindow* window, int key, int, int action, int) {
  if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
    glfwSetWindowShouldClose(window, GLFW_TRUE);
  }
}

} //  anon

PreviewWindow::~PreviewWindow() {
  close();
}

std::string PreviewWindow::open(int panel_width, int panel_height, int s) {
  close();
  scale = s;

  preview::GLFWContextCreateInfo create_info{};
  create_info.window_title = "sunarc";
  create_info.window_width = panel_width * scale;
  create_info.window_height = panel_height * scale;
  create_info.user_data = this;
  create_info.key_callback = key_callback;

  auto res = preview::create_and_initialize_glfw_context(create_info);
  if (!res) {
    return res.get_right();
  }

  context = res.get_left();
  SUNARC_LOG_INFO_CAPTURE_META("Opened preview window.", logging_id());
  return {};
}

void PreviewWindow::close() {
  preview::destroy_and_terminate_glfw_context(&context);
}

void PreviewWindow::poll_events() {
  if (context.window) {
    glfwPollEvents();
  }
}

bool PreviewWindow::should_close() const {
  return context.window_should_close();
}

void PreviewWindow::present(const raster::Framebuffer& frame) {
  if (!context.window) {
    return;
  }
  glfwMakeContextCurrent(context.window);
  glfwGetFramebufferSize(context.window, &context.framebuffer_width, &context.framebuffer_height);
  draw(frame);
  glfwSwapBuffers(context.window);
}

void PreviewWindow::draw(const raster::Framebuffer& frame) {
  glViewport(0, 0, context.framebuffer_width, context.framebuffer_height);
  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  //  One unit per panel pixel, origin at the top-left.
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  glOrtho(0.0, double(frame.width), double(frame.height), 0.0, -1.0, 1.0);
  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();

  const float px_per_unit = float(context.framebuffer_width) / float(std::max(1, frame.width));
  glEnable(GL_POINT_SMOOTH);
  glPointSize(std::max(1.0f, px_per_unit * Config::dot_fill));

  glBegin(GL_POINTS);
  for (int y = 0; y < frame.height; y++) {
    for (int x = 0; x < frame.width; x++) {
      auto c = raster::get_pixel(frame, x, y);
      const float u = Config::unlit_level;
      glColor3f(
        std::max(u, float(c.r) / 255.0f),
        std::max(u, float(c.g) / 255.0f),
        std::max(u, float(c.b) / 255.0f));
      glVertex2f(float(x) + 0.5f, float(y) + 0.5f);
    }
  }
  glEnd();
}

SUNARC_NAMESPACE_END
