#pragma once
#include "luma/gl/GlContext.hpp"

#ifdef LUMA_HAS_GLFW

struct GLFWwindow;

namespace luma {

// Windowed GL 3.3 core context.
class GlfwContext : public GlContext {
public:
  explicit GlfwContext(const char* title = "luma");
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  bool makeCurrent() override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  // Process window events and pick up framebuffer resizes.
  void pollEvents();
  bool shouldClose() const;

private:
  const char* title_;
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};
};

} // namespace luma

#endif // LUMA_HAS_GLFW
