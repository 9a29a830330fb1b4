#include "luma/program/ProgramBinder.hpp"
#include <cstdio>
#include <utility>

namespace luma {

std::string uniformBaseName(const std::string& reportedName) {
  if (reportedName.empty() || reportedName.back() != ']') return reportedName;
  std::size_t open = reportedName.rfind('[');
  if (open == std::string::npos) return reportedName;
  return reportedName.substr(0, open);
}

static bool bindUniforms(GlDriver& driver, GLuint program,
                         UniformSetterMap& out, ProgramError& err) {
  for (const ActiveVariable& info : driver.activeUniforms(program)) {
    UniformKind kind;
    if (!classifyUniformType(info.type, kind)) {
      char buf[256];
      std::snprintf(buf, sizeof(buf), "uniform '%s' has unsupported GLSL type 0x%04X",
                    info.name.c_str(), static_cast<unsigned>(info.type));
      err.code = ProgramErrc::UnknownUniformType;
      err.message = buf;
      err.path = info.name;
      return false;
    }

    std::string name = uniformBaseName(info.name);
    bool isArray = (name != info.name);
    GLint loc = driver.uniformLocation(program, info.name);

    out.erase(name);
    out.emplace(std::move(name), UniformSetter(driver, loc, kind, isArray, info.size));
  }
  return true;
}

BindResult bindProgram(GlDriver& driver, GLuint program) {
  BindResult r;

  for (const ActiveVariable& info : driver.activeAttributes(program)) {
    r.attributes[info.name] = driver.attribLocation(program, info.name);
  }

  if (!bindUniforms(driver, program, r.uniforms, r.err)) {
    std::fprintf(stderr, "ProgramBinder: %s\n", r.err.message.c_str());
    r.ok = false;
    r.attributes.clear();
    r.uniforms.clear();
  }
  return r;
}

} // namespace luma
