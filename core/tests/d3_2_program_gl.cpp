// D3.2 — Programs against a real (OSMesa) GL context: introspection,
// uniform upload read-back, error taxonomy and a rendered frame.

#include "luma/gl/OsMesaContext.hpp"
#include "luma/program/ProgramLoader.hpp"
#include "luma/shaders/ShaderPreprocessor.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(float a, float b) { return std::fabs(a - b) < 1e-5f; }

static const char* kVert = R"GLSL(#version 330 core
in vec2 position;
void main() {
    gl_Position = vec4(position, 0.0, 1.0);
}
)GLSL";

static const char* kFrag = R"GLSL(#version 330 core
uniform vec4 u_color;
uniform float u_weights[3];
uniform mat2 u_rot;
uniform ivec2 u_cell;
out vec4 fragColor;
void main() {
    vec2 r = u_rot * vec2(1.0, 0.0);
    if (r.y > 5.0) discard;
    if (u_cell.x > 100) discard;
    float w = u_weights[0] + u_weights[1] + u_weights[2];
    fragColor = vec4(u_color.rgb * w, u_color.a);
}
)GLSL";

static float readFloat(GLuint program, const char* name) {
  GLfloat v = -1.0f;
  glGetUniformfv(program, glGetUniformLocation(program, name), &v);
  return v;
}

static void testIntrospection(luma::GlDriver& driver) {
  std::printf("  sub-test: introspection and read-back\n");
  luma::ProgramResult r = luma::ShaderProgram::build(driver, kVert, kFrag);
  if (!r.ok) {
    std::fprintf(stderr, "build failed: %s\n", r.err.message.c_str());
    std::exit(1);
  }
  luma::ShaderProgram& p = *r.program;

  requireTrue(p.attribLocation("position") >= 0, "position attribute active");
  requireTrue(p.hasUniform("u_color"), "u_color");
  requireTrue(p.hasUniform("u_weights"), "u_weights keyed by base name");
  requireTrue(p.uniform("u_weights")->isArray(), "u_weights is an array");
  requireTrue(p.uniform("u_weights")->arraySize() == 3, "u_weights size 3");
  requireTrue(p.uniform("u_rot")->kind() == luma::UniformKind::FloatMat2, "u_rot mat2");
  requireTrue(p.uniform("u_cell")->kind() == luma::UniformKind::IntVec2, "u_cell ivec2");

  p.use();
  p.setUniforms({
    {"u_color", {0.25f, 0.5f, 1.0f, 1.0f}},
    {"u_weights", {0.5f, 0.25f, 0.25f}},
    {"u_rot", {0.0f, 1.0f, -1.0f, 0.0f}},
    {"u_cell", {1, 2}},
  });

  const GLuint id = p.id();
  requireTrue(near(readFloat(id, "u_weights[0]"), 0.5f), "u_weights[0]");
  requireTrue(near(readFloat(id, "u_weights[1]"), 0.25f), "u_weights[1]");
  requireTrue(near(readFloat(id, "u_weights[2]"), 0.25f), "u_weights[2]");

  GLfloat color[4] = {};
  glGetUniformfv(id, glGetUniformLocation(id, "u_color"), color);
  requireTrue(near(color[0], 0.25f) && near(color[1], 0.5f) && near(color[3], 1.0f), "u_color");

  // Column-major upload: second column is (-1, 0).
  GLfloat rot[4] = {};
  glGetUniformfv(id, glGetUniformLocation(id, "u_rot"), rot);
  requireTrue(near(rot[1], 1.0f) && near(rot[2], -1.0f), "u_rot not transposed");

  GLint cell[2] = {};
  glGetUniformiv(id, glGetUniformLocation(id, "u_cell"), cell);
  requireTrue(cell[0] == 1 && cell[1] == 2, "u_cell");
  requireTrue(glGetError() == GL_NO_ERROR, "no GL error");
  std::printf("    PASS\n");
}

static void testErrors(luma::GlDriver& driver) {
  std::printf("  sub-test: error taxonomy\n");

  luma::ProgramResult r = luma::ShaderProgram::build(
      driver, "#version 330 core\nvoid main() { gl_Position = undefined_thing; }\n", kFrag);
  requireTrue(!r.ok, "compile error");
  requireTrue(r.err.code == luma::ProgramErrc::ShaderCompile, "ShaderCompile");
  requireTrue(r.err.message.size() > std::string("vertex shader compile error:\n").size(),
              "driver log attached");

  const char* needsVarying = R"GLSL(#version 330 core
in vec3 vNormal;
out vec4 fragColor;
void main() { fragColor = vec4(vNormal, 1.0); }
)GLSL";
  r = luma::ShaderProgram::build(driver, kVert, needsVarying);
  requireTrue(!r.ok, "link error");
  requireTrue(r.err.code == luma::ProgramErrc::ProgramLink, "ProgramLink");

  const char* unsignedUniform = R"GLSL(#version 330 core
uniform uint u_id;
out vec4 fragColor;
void main() {
    if (u_id > 3u) discard;
    fragColor = vec4(1.0);
}
)GLSL";
  r = luma::ShaderProgram::build(driver, kVert, unsignedUniform);
  requireTrue(!r.ok, "unsupported uniform type");
  requireTrue(r.err.code == luma::ProgramErrc::UnknownUniformType, "UnknownUniformType");
  requireTrue(r.err.path == "u_id", "names the uniform");
  requireTrue(glGetError() == GL_NO_ERROR, "no GL error");
  std::printf("    PASS\n");
}

static void testDefaultShaders(luma::GlDriver& driver) {
  std::printf("  sub-test: built-in shaders compile\n");
  luma::ProgramResult r = luma::fromDefaultShaders(driver);
  if (!r.ok) {
    std::fprintf(stderr, "default program failed: %s\n", r.err.message.c_str());
    std::exit(1);
  }
  requireTrue(r.program->attribLocation("position") >= 0, "position active");
  requireTrue(r.program->hasUniform("projectionMatrix"), "projectionMatrix");
  requireTrue(r.program->hasUniform("enableLights"), "lighting chunk uniforms");

  luma::ProgramOptions opt;
  opt.fs = "Solid";
  r = luma::fromDefaultShaders(driver, opt);
  requireTrue(r.ok, "Solid program");
  requireTrue(r.program->hasUniform("u_color"), "Solid u_color");
  std::printf("    PASS\n");
}

static void testExtensions(luma::GlDriver& driver) {
  std::printf("  sub-test: extension snapshot\n");
  std::vector<std::string> names = driver.extensions();
  luma::ExtensionSet set = luma::ExtensionSet::fromDriver(driver);
  for (const auto& n : names) {
    requireTrue(set.has(n), "reported extension present");
  }
  requireTrue(!set.has("GL_LUMA_not_a_real_extension"), "made-up extension absent");
  std::printf("    PASS (%zu extensions)\n", names.size());
}

static void testRender(luma::OsMesaContext& ctx) {
  std::printf("  sub-test: render\n");
  luma::ProgramResult r = luma::ShaderProgram::build(ctx.driver(), kVert, kFrag);
  requireTrue(r.ok, "build");
  luma::ShaderProgram& p = *r.program;
  p.use();
  p.setUniforms({
    {"u_color", {0.25f, 0.5f, 1.0f, 1.0f}},
    {"u_weights", {0.5f, 0.25f, 0.25f}},
    {"u_rot", {1.0f, 0.0f, 0.0f, 1.0f}},
    {"u_cell", {0, 0}},
  });

  const float tri[] = {-1.0f, -1.0f, 3.0f, -1.0f, -1.0f, 3.0f};
  GLuint vao = 0, vbo = 0;
  glGenVertexArrays(1, &vao);
  glGenBuffers(1, &vbo);
  glBindVertexArray(vao);
  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  glBufferData(GL_ARRAY_BUFFER, sizeof(tri), tri, GL_STATIC_DRAW);
  GLuint loc = static_cast<GLuint>(p.attribLocation("position"));
  glEnableVertexAttribArray(loc);
  glVertexAttribPointer(loc, 2, GL_FLOAT, GL_FALSE, 0, nullptr);

  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);
  glDrawArrays(GL_TRIANGLES, 0, 3);
  ctx.swapBuffers();

  std::vector<std::uint8_t> pixels = ctx.readPixels();
  const int cx = ctx.width() / 2, cy = ctx.height() / 2;
  const std::uint8_t* px = &pixels[static_cast<std::size_t>((cy * ctx.width() + cx) * 4)];
  std::printf("    center pixel: %d %d %d %d\n", px[0], px[1], px[2], px[3]);
  requireTrue(std::abs(px[0] - 64) <= 2, "red channel");
  requireTrue(std::abs(px[1] - 128) <= 2, "green channel");
  requireTrue(px[2] >= 253, "blue channel");

  glDeleteBuffers(1, &vbo);
  glDeleteVertexArrays(1, &vao);
  std::printf("    PASS\n");
}

int main() {
  std::printf("D3.2 program_gl\n");
  luma::OsMesaContext ctx;
  if (!ctx.init(64, 64)) {
    std::printf("D3.2 program_gl: SKIPPED (no OSMesa context)\n");
    return 0;
  }

  requireTrue(ctx.info().major > 3 || (ctx.info().major == 3 && ctx.info().minor >= 3),
              "GL 3.3 or newer");
  requireTrue(!ctx.info().glslVersion.empty(), "GLSL version reported");
  requireTrue(ctx.makeCurrent(), "makeCurrent");

  testIntrospection(ctx.driver());
  testErrors(ctx.driver());
  testDefaultShaders(ctx.driver());
  testExtensions(ctx.driver());
  testRender(ctx);
  std::printf("D3.2 program_gl: ALL PASS\n");
  return 0;
}
