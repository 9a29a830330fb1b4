#ifdef LUMA_HAS_GLFW

#include "luma/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>

namespace luma {

GlfwContext::GlfwContext(const char* title) : title_(title) {}

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, title_, nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  makeCurrent();

  if (!loadGl((GLADloadfunc)glfwGetProcAddress, "GlfwContext", 3, 3)) {
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);
  glViewport(0, 0, width_, height_);
  return true;
}

bool GlfwContext::makeCurrent() {
  if (!window_) return false;
  glfwMakeContextCurrent(window_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

void GlfwContext::pollEvents() {
  glfwPollEvents();
  if (!window_) return;

  int w = 0, h = 0;
  glfwGetFramebufferSize(window_, &w, &h);
  if (w != width_ || h != height_) {
    width_ = w;
    height_ = h;
    glViewport(0, 0, w, h);
  }
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

} // namespace luma

#endif // LUMA_HAS_GLFW
