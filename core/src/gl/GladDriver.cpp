#include "luma/gl/GladDriver.hpp"
#include <utility>

namespace luma {

GLuint GladDriver::createShader(GLenum type) {
  return glCreateShader(type);
}

void GladDriver::shaderSource(GLuint shader, const std::string& src) {
  const char* text = src.c_str();
  GLint len = static_cast<GLint>(src.size());
  glShaderSource(shader, 1, &text, &len);
}

void GladDriver::compileShader(GLuint shader) {
  glCompileShader(shader);
}

bool GladDriver::compileStatus(GLuint shader) {
  GLint ok = 0;
  glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
  return ok != 0;
}

std::string GladDriver::shaderInfoLog(GLuint shader) {
  GLint len = 0;
  glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
  if (len <= 0) return {};
  std::string log(static_cast<std::size_t>(len), '\0');
  GLsizei written = 0;
  glGetShaderInfoLog(shader, len, &written, &log[0]);
  log.resize(static_cast<std::size_t>(written));
  return log;
}

void GladDriver::deleteShader(GLuint shader) {
  glDeleteShader(shader);
}

GLuint GladDriver::createProgram() {
  return glCreateProgram();
}

void GladDriver::attachShader(GLuint program, GLuint shader) {
  glAttachShader(program, shader);
}

void GladDriver::linkProgram(GLuint program) {
  glLinkProgram(program);
}

bool GladDriver::linkStatus(GLuint program) {
  GLint ok = 0;
  glGetProgramiv(program, GL_LINK_STATUS, &ok);
  return ok != 0;
}

std::string GladDriver::programInfoLog(GLuint program) {
  GLint len = 0;
  glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
  if (len <= 0) return {};
  std::string log(static_cast<std::size_t>(len), '\0');
  GLsizei written = 0;
  glGetProgramInfoLog(program, len, &written, &log[0]);
  log.resize(static_cast<std::size_t>(written));
  return log;
}

void GladDriver::deleteProgram(GLuint program) {
  glDeleteProgram(program);
}

void GladDriver::useProgram(GLuint program) {
  glUseProgram(program);
}

std::vector<ActiveVariable> GladDriver::activeAttributes(GLuint program) {
  GLint count = 0;
  GLint maxLen = 0;
  glGetProgramiv(program, GL_ACTIVE_ATTRIBUTES, &count);
  glGetProgramiv(program, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH, &maxLen);

  std::vector<ActiveVariable> out;
  std::vector<char> name(static_cast<std::size_t>(maxLen > 0 ? maxLen : 1));
  for (GLint i = 0; i < count; i++) {
    GLsizei len = 0;
    ActiveVariable v;
    glGetActiveAttrib(program, static_cast<GLuint>(i), maxLen, &len,
                      &v.size, &v.type, name.data());
    v.name.assign(name.data(), static_cast<std::size_t>(len));
    out.push_back(std::move(v));
  }
  return out;
}

std::vector<ActiveVariable> GladDriver::activeUniforms(GLuint program) {
  GLint count = 0;
  GLint maxLen = 0;
  glGetProgramiv(program, GL_ACTIVE_UNIFORMS, &count);
  glGetProgramiv(program, GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxLen);

  std::vector<ActiveVariable> out;
  std::vector<char> name(static_cast<std::size_t>(maxLen > 0 ? maxLen : 1));
  for (GLint i = 0; i < count; i++) {
    GLsizei len = 0;
    ActiveVariable v;
    glGetActiveUniform(program, static_cast<GLuint>(i), maxLen, &len,
                       &v.size, &v.type, name.data());
    v.name.assign(name.data(), static_cast<std::size_t>(len));
    out.push_back(std::move(v));
  }
  return out;
}

GLint GladDriver::attribLocation(GLuint program, const std::string& name) {
  return glGetAttribLocation(program, name.c_str());
}

GLint GladDriver::uniformLocation(GLuint program, const std::string& name) {
  return glGetUniformLocation(program, name.c_str());
}

// Core profile: extensions are enumerated one by one.
std::vector<std::string> GladDriver::extensions() {
  GLint count = 0;
  glGetIntegerv(GL_NUM_EXTENSIONS, &count);
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(count > 0 ? count : 0));
  for (GLint i = 0; i < count; i++) {
    const char* ext = reinterpret_cast<const char*>(
        glGetStringi(GL_EXTENSIONS, static_cast<GLuint>(i)));
    if (ext) out.emplace_back(ext);
  }
  return out;
}

void GladDriver::uniform1f(GLint loc, GLfloat v) { glUniform1f(loc, v); }
void GladDriver::uniform1i(GLint loc, GLint v) { glUniform1i(loc, v); }

void GladDriver::uniform1fv(GLint loc, GLsizei count, const GLfloat* v) { glUniform1fv(loc, count, v); }
void GladDriver::uniform2fv(GLint loc, GLsizei count, const GLfloat* v) { glUniform2fv(loc, count, v); }
void GladDriver::uniform3fv(GLint loc, GLsizei count, const GLfloat* v) { glUniform3fv(loc, count, v); }
void GladDriver::uniform4fv(GLint loc, GLsizei count, const GLfloat* v) { glUniform4fv(loc, count, v); }

void GladDriver::uniform1iv(GLint loc, GLsizei count, const GLint* v) { glUniform1iv(loc, count, v); }
void GladDriver::uniform2iv(GLint loc, GLsizei count, const GLint* v) { glUniform2iv(loc, count, v); }
void GladDriver::uniform3iv(GLint loc, GLsizei count, const GLint* v) { glUniform3iv(loc, count, v); }
void GladDriver::uniform4iv(GLint loc, GLsizei count, const GLint* v) { glUniform4iv(loc, count, v); }

void GladDriver::uniformMatrix2fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) {
  glUniformMatrix2fv(loc, count, transpose, v);
}

void GladDriver::uniformMatrix3fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) {
  glUniformMatrix3fv(loc, count, transpose, v);
}

void GladDriver::uniformMatrix4fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) {
  glUniformMatrix4fv(loc, count, transpose, v);
}

} // namespace luma
