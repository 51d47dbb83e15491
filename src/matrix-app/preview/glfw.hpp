#pragma once

#include "sunarc/common/Either.hpp"
#include <string>

struct GLFWwindow;

namespace sunarc::preview {

using GLFWKeyCallback = void(GLFWwindow*, int, int, int, int);

struct GLFWContext {
  void set_window_should_close(bool v) const;
  bool window_should_close() const;

  bool initialized{};
  GLFWwindow* window{};
  int framebuffer_width{};
  int framebuffer_height{};
};

struct GLFWContextCreateInfo {
  const char* window_title{""};
  int window_width{768};
  int window_height{384};
  void* user_data{};
  GLFWKeyCallback* key_callback{};
};

using GLFWContextResult = Either<GLFWContext, std::string>;

//  Creates a window with a legacy (2.1) OpenGL context made current on this thread.
GLFWContextResult create_and_initialize_glfw_context(const GLFWContextCreateInfo& info);
void destroy_and_terminate_glfw_context(GLFWContext* context);

}
