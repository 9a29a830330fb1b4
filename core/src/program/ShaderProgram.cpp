#include "luma/program/ShaderProgram.hpp"
#include <cstdio>
#include <memory>

namespace luma {

ShaderProgram::ShaderProgram(Key, GlDriver& driver, GLuint program,
                             AttributeMap attributes, UniformSetterMap uniforms)
  : driver_(&driver), program_(program),
    attributes_(std::move(attributes)), uniforms_(std::move(uniforms)) {}

ShaderProgram::~ShaderProgram() {
  if (program_) {
    driver_->deleteProgram(program_);
  }
}

static const char* stageName(GLenum type) {
  return type == GL_VERTEX_SHADER ? "vertex" : "fragment";
}

static GLuint compileShader(GlDriver& driver, GLenum type, const std::string& src,
                            ProgramError& err) {
  GLuint s = driver.createShader(type);
  if (!s) {
    err.code = ProgramErrc::ShaderCompile;
    err.message = std::string("could not create ") + stageName(type) + " shader";
    std::fprintf(stderr, "ShaderProgram: %s\n", err.message.c_str());
    return 0;
  }

  driver.shaderSource(s, src);
  driver.compileShader(s);

  if (!driver.compileStatus(s)) {
    err.code = ProgramErrc::ShaderCompile;
    err.message = std::string(stageName(type)) + " shader compile error:\n" +
                  driver.shaderInfoLog(s);
    std::fprintf(stderr, "ShaderProgram: %s\n", err.message.c_str());
    driver.deleteShader(s);
    return 0;
  }
  return s;
}

ProgramResult ShaderProgram::build(GlDriver& driver,
                                   const std::string& vertSrc,
                                   const std::string& fragSrc) {
  ProgramResult r;

  GLuint vs = compileShader(driver, GL_VERTEX_SHADER, vertSrc, r.err);
  if (!vs) { r.ok = false; return r; }

  GLuint fs = compileShader(driver, GL_FRAGMENT_SHADER, fragSrc, r.err);
  if (!fs) { driver.deleteShader(vs); r.ok = false; return r; }

  GLuint program = driver.createProgram();
  if (!program) {
    r.ok = false;
    r.err.code = ProgramErrc::ProgramLink;
    r.err.message = "could not create program";
    std::fprintf(stderr, "ShaderProgram: %s\n", r.err.message.c_str());
    driver.deleteShader(vs);
    driver.deleteShader(fs);
    return r;
  }
  driver.attachShader(program, vs);
  driver.attachShader(program, fs);
  driver.linkProgram(program);

  // Shaders can be deleted after linking.
  driver.deleteShader(vs);
  driver.deleteShader(fs);

  if (!driver.linkStatus(program)) {
    r.ok = false;
    r.err.code = ProgramErrc::ProgramLink;
    r.err.message = "program link error:\n" + driver.programInfoLog(program);
    std::fprintf(stderr, "ShaderProgram: %s\n", r.err.message.c_str());
    driver.deleteProgram(program);
    return r;
  }

  BindResult bound = bindProgram(driver, program);
  if (!bound.ok) {
    r.ok = false;
    r.err = bound.err;
    driver.deleteProgram(program);
    return r;
  }

  r.program = std::make_unique<ShaderProgram>(Key{}, driver, program,
                                              std::move(bound.attributes),
                                              std::move(bound.uniforms));
  return r;
}

void ShaderProgram::use() const {
  driver_->useProgram(program_);
}

ShaderProgram& ShaderProgram::setUniform(const std::string& name, const UniformValue& value) {
  auto it = uniforms_.find(name);
  if (it != uniforms_.end()) {
    it->second(value);
  }
  return *this;
}

ShaderProgram& ShaderProgram::setUniforms(const UniformAssignments& values) {
  for (const auto& kv : values) {
    setUniform(kv.first, kv.second);
  }
  return *this;
}

bool ShaderProgram::hasUniform(const std::string& name) const {
  return uniforms_.count(name) != 0;
}

UniformSetter* ShaderProgram::uniform(const std::string& name) {
  auto it = uniforms_.find(name);
  return it == uniforms_.end() ? nullptr : &it->second;
}

GLint ShaderProgram::attribLocation(const std::string& name) const {
  auto it = attributes_.find(name);
  return it == attributes_.end() ? -1 : it->second;
}

} // namespace luma
