#include "glfw.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/common/scope.hpp"
#include <GLFW/glfw3.h>

SUNARC_NAMESPACE_BEGIN

using namespace preview;

namespace {

GLFWContextResult make_error(const char* message) {
  return either::make_right<GLFWContextResult>(std::string{message});
}

} //  anon

void preview::GLFWContext::set_window_should_close(bool v) const {
  if (window) {
    glfwSetWindowShouldClose(window, v);
  }
}

bool preview::GLFWContext::window_should_close() const {
  return window == nullptr || glfwWindowShouldClose(window);
}

void preview::destroy_and_terminate_glfw_context(GLFWContext* context) {
  if (context->window) {
    glfwDestroyWindow(context->window);
    context->window = nullptr;
  }
  if (context->initialized) {
    glfwTerminate();
    context->initialized = false;
  }
  context->framebuffer_width = 0;
  context->framebuffer_height = 0;
}

GLFWContextResult preview::create_and_initialize_glfw_context(const GLFWContextCreateInfo& info) {
  GLFWContext context{};
  bool success = false;
  SUNARC_SCOPE_EXIT {
    if (!success) {
      destroy_and_terminate_glfw_context(&context);
    }
  };

  if (glfwInit()) {
    context.initialized = true;
  } else {
    return make_error("Failed to initialize GLFW.");
  }

  glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

  auto* window = glfwCreateWindow(
    info.window_width, info.window_height, info.window_title, nullptr, nullptr);
  if (!window) {
    return make_error("Failed to create GLFW window.");
  } else {
    context.window = window;
  }

  glfwMakeContextCurrent(window);
  glfwSwapInterval(1);
  glfwGetFramebufferSize(window, &context.framebuffer_width, &context.framebuffer_height);
  glfwSetWindowUserPointer(window, info.user_data);
  glfwSetKeyCallback(window, info.key_callback);
  success = true;
  return either::make_left<GLFWContextResult>(context);
}

SUNARC_NAMESPACE_END
