#pragma once
#include <glad/gl.h>
#include <string>
#include <vector>

namespace luma {

// One entry of glGetActiveAttrib / glGetActiveUniform.
struct ActiveVariable {
  std::string name;   // as reported, e.g. "u_colors[0]"
  GLenum type{0};     // GL type tag, e.g. GL_FLOAT_VEC4
  GLint size{1};      // array length (1 for non-arrays)
};

// The GL entry points the program layer needs. Passed explicitly to
// everything that talks to the driver; GladDriver forwards to the
// current context, tests substitute a recording stub.
class GlDriver {
public:
  virtual ~GlDriver() = default;

  // ---- shaders / programs ----
  virtual GLuint createShader(GLenum type) = 0;
  virtual void shaderSource(GLuint shader, const std::string& src) = 0;
  virtual void compileShader(GLuint shader) = 0;
  virtual bool compileStatus(GLuint shader) = 0;
  virtual std::string shaderInfoLog(GLuint shader) = 0;
  virtual void deleteShader(GLuint shader) = 0;

  virtual GLuint createProgram() = 0;
  virtual void attachShader(GLuint program, GLuint shader) = 0;
  virtual void linkProgram(GLuint program) = 0;
  virtual bool linkStatus(GLuint program) = 0;
  virtual std::string programInfoLog(GLuint program) = 0;
  virtual void deleteProgram(GLuint program) = 0;
  virtual void useProgram(GLuint program) = 0;

  // ---- introspection ----
  virtual std::vector<ActiveVariable> activeAttributes(GLuint program) = 0;
  virtual std::vector<ActiveVariable> activeUniforms(GLuint program) = 0;
  virtual GLint attribLocation(GLuint program, const std::string& name) = 0;
  virtual GLint uniformLocation(GLuint program, const std::string& name) = 0;
  // Names as the driver reports them, e.g. "GL_ARB_texture_float".
  virtual std::vector<std::string> extensions() = 0;

  // ---- uniform upload ----
  virtual void uniform1f(GLint loc, GLfloat v) = 0;
  virtual void uniform1i(GLint loc, GLint v) = 0;

  virtual void uniform1fv(GLint loc, GLsizei count, const GLfloat* v) = 0;
  virtual void uniform2fv(GLint loc, GLsizei count, const GLfloat* v) = 0;
  virtual void uniform3fv(GLint loc, GLsizei count, const GLfloat* v) = 0;
  virtual void uniform4fv(GLint loc, GLsizei count, const GLfloat* v) = 0;

  virtual void uniform1iv(GLint loc, GLsizei count, const GLint* v) = 0;
  virtual void uniform2iv(GLint loc, GLsizei count, const GLint* v) = 0;
  virtual void uniform3iv(GLint loc, GLsizei count, const GLint* v) = 0;
  virtual void uniform4iv(GLint loc, GLsizei count, const GLint* v) = 0;

  virtual void uniformMatrix2fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) = 0;
  virtual void uniformMatrix3fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) = 0;
  virtual void uniformMatrix4fv(GLint loc, GLsizei count, GLboolean transpose, const GLfloat* v) = 0;
};

} // namespace luma
