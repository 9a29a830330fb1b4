#pragma once
#include "luma/gl/GladDriver.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace luma {

// What the driver reported once the entry points were loaded.
struct GlInfo {
  int major{0};
  int minor{0};
  std::string vendor;
  std::string renderer;
  std::string version;
  std::string glslVersion;
};

class GlContext {
public:
  virtual ~GlContext() = default;

  // Create the context, make it current and load GL entry points.
  virtual bool init(int width, int height) = 0;
  virtual bool makeCurrent() = 0;
  virtual void swapBuffers() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Read back RGBA pixels from the framebuffer.
  virtual std::vector<std::uint8_t> readPixels() const = 0;

  // Driver for this context. Only usable after init() returned true, and
  // only from the thread the context is current on.
  GlDriver& driver() { return driver_; }

  const GlInfo& info() const { return info_; }

protected:
  // Load entry points through `getProc` for the current context and fill
  // info(). Fails if the context is older than major.minor.
  bool loadGl(GLADloadfunc getProc, const char* who, int major, int minor);

  GladDriver driver_;
  GlInfo info_;
};

} // namespace luma
