#include "luma/gl/OsMesaContext.hpp"
#include <cstdio>

namespace luma {

OsMesaContext::OsMesaContext(int glMajor, int glMinor)
  : glMajor_(glMajor), glMinor_(glMinor) {}

OsMesaContext::~OsMesaContext() {
  destroy();
}

void OsMesaContext::destroy() {
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
  }
}

bool OsMesaContext::init(int width, int height) {
  const int attribs[] = {
    OSMESA_FORMAT,                OSMESA_RGBA,
    OSMESA_DEPTH_BITS,            24,
    OSMESA_STENCIL_BITS,          8,
    OSMESA_PROFILE,               OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, glMajor_,
    OSMESA_CONTEXT_MINOR_VERSION, glMinor_,
    0
  };

  destroy();
  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaContext: no %d.%d core context\n", glMajor_, glMinor_);
    return false;
  }

  width_ = width;
  height_ = height;
  framebuf_.assign(static_cast<std::size_t>(width) * height * 4, 0);

  if (!makeCurrent()) {
    destroy();
    return false;
  }

  if (!loadGl((GLADloadfunc)OSMesaGetProcAddress, "OsMesaContext", glMajor_, glMinor_)) {
    destroy();
    return false;
  }

  glViewport(0, 0, width, height);
  return true;
}

bool OsMesaContext::makeCurrent() {
  if (!ctx_) return false;
  if (!OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width_, height_)) {
    std::fprintf(stderr, "OsMesaContext: OSMesaMakeCurrent failed\n");
    return false;
  }
  return true;
}

void OsMesaContext::swapBuffers() {
  glFinish();
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

} // namespace luma
