#pragma once
#include "luma/gl/GlDriver.hpp"

namespace luma {

// GlDriver over the glad-loaded entry points of whatever context is
// current. Call only after gladLoadGL succeeded.
class GladDriver : public GlDriver {
public:
  GLuint createShader(GLenum type) override;
  void shaderSource(GLuint shader, const std::string& src) override;
  void compileShader(GLuint shader) override;
  bool compileStatus(GLuint shader) override;
  std::string shaderInfoLog(GLuint shader) override;
  void deleteShader(GLuint shader) override;

  GLuint createProgram() override;
  void attachShader(GLuint program, GLuint shader) override;
  void linkProgram(GLuint program) override;
  bool linkStatus(GLuint program) override;
  std::string programInfoLog(GLuint program) override;
  void deleteProgram(GLuint program) override;
  void useProgram(GLuint program) override;

  std::vector<ActiveVariable> activeAttributes(GLuint program) override;
  std::vector<ActiveVariable> activeUniforms(GLuint program) override;
  GLint attribLocation(GLuint program, const std::string& name) override;
  GLint uniformLocation(GLuint program, const std::string& name) override;
  std::vector<std::string> extensions() override;

  void uniform1f(GLint loc, GLfloat v) override;
  void uniform1i(GLint loc, GLint v) override;

  void uniform1fv(GLint loc, GLsizei count, const GLfloat* v) override;
  void uniform2fv(GLint loc, GLsizei count, const GLfloat* v) override;
  void uniform3fv(GLint loc, GLsizei count, const GLfloat* v) override;
  void uniform4fv(GLint loc, GLsizei count, const GLfloat* v) override;

  void uniform1iv(GLint loc, GLsizei count, const GLint* v) override;
  void uniform2iv(GLint loc, GLsizei count, const GLint* v) override;
  void uniform3iv(GLint loc, GLsizei count, const GLint* v) override;
  void uniform4iv(GLint loc, GLsizei count, const GLint* v) override;

  void uniformMatrix2fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) override;
  void uniformMatrix3fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) override;
  void uniformMatrix4fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) override;
};

} // namespace luma
