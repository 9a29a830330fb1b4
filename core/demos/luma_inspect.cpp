// luma_inspect — build a program from a JSON manifest and print its
// attributes / uniforms as JSON.
// Uses GLFW with --window (draws until closed), otherwise OSMesa; --ppm
// writes one headless frame.
//
//   luma_inspect shaders/lit.json [--window] [--ppm frame.ppm]

#include "luma/config/ProgramManifest.hpp"
#include "luma/debug/ProgramReport.hpp"
#include "luma/gl/GlContext.hpp"
#include "luma/program/ProgramLoader.hpp"
#include "luma/shaders/ShaderPreprocessor.hpp"
#include "luma/shaders/SourceFetcher.hpp"

#ifdef LUMA_HAS_GLFW
#include "luma/gl/GlfwContext.hpp"
#endif
#ifdef LUMA_HAS_OSMESA
#include "luma/gl/OsMesaContext.hpp"
#endif

#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

static const int W = 256;
static const int H = 256;

static void usage() {
  std::fprintf(stderr, "usage: luma_inspect <manifest.json> [--window] [--ppm out.ppm]\n");
}

static void writePPM(const char* filename, const std::vector<std::uint8_t>& pixels,
                     int w, int h) {
  FILE* f = std::fopen(filename, "wb");
  if (!f) {
    std::fprintf(stderr, "Cannot open %s for writing\n", filename);
    return;
  }
  std::fprintf(f, "P6\n%d %d\n255\n", w, h);
  // OpenGL pixels are bottom-up; flip for PPM (top-down)
  for (int y = h - 1; y >= 0; y--) {
    for (int x = 0; x < w; x++) {
      std::size_t idx = static_cast<std::size_t>((y * w + x) * 4);
      std::fputc(pixels[idx + 0], f);
      std::fputc(pixels[idx + 1], f);
      std::fputc(pixels[idx + 2], f);
    }
  }
  std::fclose(f);
  std::fprintf(stderr, "Wrote %s (%dx%d)\n", filename, w, h);
}

// Full-screen triangle fed to the "position" attribute, if the program has one.
struct Triangle {
  GLuint vao{0};
  GLuint vbo{0};

  bool setup(GLint positionLoc) {
    if (positionLoc < 0) return false;
    static const float verts[] = { -1.0f, -1.0f,  3.0f, -1.0f,  -1.0f, 3.0f };
    glGenVertexArrays(1, &vao);
    glBindVertexArray(vao);
    glGenBuffers(1, &vbo);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(verts), verts, GL_STATIC_DRAW);
    glEnableVertexAttribArray(static_cast<GLuint>(positionLoc));
    glVertexAttribPointer(static_cast<GLuint>(positionLoc), 2, GL_FLOAT, GL_FALSE, 0, nullptr);
    return true;
  }

  void draw() const {
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, 3);
  }

  ~Triangle() {
    if (vbo) glDeleteBuffers(1, &vbo);
    if (vao) glDeleteVertexArrays(1, &vao);
  }
};

int main(int argc, char* argv[]) {
  std::string manifestPath;
  std::string ppmPath;
  bool window = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--window") {
      window = true;
    } else if (arg == "--ppm" && i + 1 < argc) {
      ppmPath = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      usage();
      return 1;
    } else {
      manifestPath = arg;
    }
  }
  if (manifestPath.empty()) {
    usage();
    return 1;
  }

  // Manifest paths are relative to the manifest itself.
  luma::FileSourceFetcher fetcher(luma::includeDirectory(manifestPath));
  std::string manifestText, err;
  if (!luma::FileSourceFetcher().fetch(manifestPath, manifestText, err)) {
    std::fprintf(stderr, "luma_inspect: %s\n", err.c_str());
    return 1;
  }

  luma::ProgramManifest manifest;
  if (!luma::parseProgramManifest(manifestText, manifest, err)) {
    std::fprintf(stderr, "luma_inspect: %s: %s\n", manifestPath.c_str(), err.c_str());
    return 1;
  }

  std::unique_ptr<luma::GlContext> ctx;
  bool isWindowed = false;

#ifdef LUMA_HAS_GLFW
  if (window) {
    auto glfw = std::make_unique<luma::GlfwContext>("luma_inspect");
    if (glfw->init(W, H)) {
      ctx = std::move(glfw);
      isWindowed = true;
    } else {
      std::fprintf(stderr, "GLFW init failed, falling back to OSMesa\n");
    }
  }
#else
  if (window) std::fprintf(stderr, "built without GLFW, using OSMesa\n");
#endif

#ifdef LUMA_HAS_OSMESA
  if (!ctx) {
    auto mesa = std::make_unique<luma::OsMesaContext>();
    if (!mesa->init(W, H)) {
      std::fprintf(stderr, "OSMesa init failed\n");
      return 1;
    }
    ctx = std::move(mesa);
  }
#endif

  if (!ctx) {
    std::fprintf(stderr, "luma_inspect: no GL context available\n");
    return 1;
  }

  luma::ProgramResult r = luma::fromManifest(ctx->driver(), fetcher, manifest);
  if (!r.ok) {
    std::fprintf(stderr, "%s\n", luma::programErrorJson(r.err).c_str());
    return 1;
  }

  std::printf("%s\n", luma::programReportJson(*r.program).c_str());

  Triangle tri;
  if (!tri.setup(r.program->attribLocation("position"))) {
    return 0;  // nothing to draw with
  }

#ifdef LUMA_HAS_GLFW
  if (isWindowed) {
    auto* glfw = static_cast<luma::GlfwContext*>(ctx.get());
    while (!glfw->shouldClose()) {
      glfw->pollEvents();
      glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
      glClear(GL_COLOR_BUFFER_BIT);
      r.program->use();
      tri.draw();
      glfw->swapBuffers();
    }
    return 0;
  }
#endif
  (void)isWindowed;

  glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);
  r.program->use();
  tri.draw();
  ctx->swapBuffers();

  if (!ppmPath.empty()) {
    writePPM(ppmPath.c_str(), ctx->readPixels(), ctx->width(), ctx->height());
  }
  return 0;
}
