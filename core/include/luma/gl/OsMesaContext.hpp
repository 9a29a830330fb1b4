#pragma once
#include "luma/gl/GlContext.hpp"
#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// OSMesa header uses GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>
#include <vector>

namespace luma {

// Headless core-profile context rendering into a CPU buffer. Shader
// programs built here behave as on a windowed context, which is what the
// GL tests and luma_inspect rely on.
class OsMesaContext : public GlContext {
public:
  explicit OsMesaContext(int glMajor = 3, int glMinor = 3);
  ~OsMesaContext() override;

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  bool init(int width, int height) override;
  bool makeCurrent() override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

private:
  int glMajor_;
  int glMinor_;
  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> framebuf_;

  void destroy();
};

} // namespace luma
