#include "luma/gl/GlContext.hpp"
#include <cstdio>

namespace luma {

static std::string glString(GLenum name) {
  const GLubyte* s = glGetString(name);
  return s ? reinterpret_cast<const char*>(s) : "";
}

bool GlContext::loadGl(GLADloadfunc getProc, const char* who, int major, int minor) {
  int version = gladLoadGL(getProc);
  if (!version) {
    std::fprintf(stderr, "%s: gladLoadGL failed\n", who);
    return false;
  }

  info_.major = GLAD_VERSION_MAJOR(version);
  info_.minor = GLAD_VERSION_MINOR(version);
  if (info_.major < major || (info_.major == major && info_.minor < minor)) {
    std::fprintf(stderr, "%s: GL %d.%d is older than the required %d.%d\n",
                 who, info_.major, info_.minor, major, minor);
    return false;
  }

  info_.vendor = glString(GL_VENDOR);
  info_.renderer = glString(GL_RENDERER);
  info_.version = glString(GL_VERSION);
  info_.glslVersion = glString(GL_SHADING_LANGUAGE_VERSION);

  std::fprintf(stderr, "%s: GL %d.%d, GLSL %s (%s)\n", who, info_.major, info_.minor,
               info_.glslVersion.c_str(), info_.renderer.c_str());
  return true;
}

} // namespace luma
