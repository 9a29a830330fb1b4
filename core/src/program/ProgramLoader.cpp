#include "luma/program/ProgramLoader.hpp"
#include "luma/shaders/ShaderLibrary.hpp"
#include "luma/shaders/ShaderPreprocessor.hpp"
#include <cstdio>
#include <future>

namespace luma {

static ProgramResult failed(const ProgramError& err) {
  ProgramResult r;
  r.ok = false;
  r.err = err;
  return r;
}

// Wait for both stages, then build. The vertex error wins if both fail.
static ProgramResult buildFromFutures(GlDriver& driver,
                                      std::future<PreprocessResult> vsFuture,
                                      std::future<PreprocessResult> fsFuture) {
  PreprocessResult vs = vsFuture.get();
  PreprocessResult fs = fsFuture.get();
  if (!vs.ok) return failed(vs.err);
  if (!fs.ok) return failed(fs.err);
  return ShaderProgram::build(driver, vs.source, fs.source);
}

ProgramResult fromShaderSources(GlDriver& driver, SourceFetcher& fetcher,
                                const ProgramOptions& opt) {
  ShaderPreprocessor pp(fetcher, ExtensionSet::fromDriver(driver));
  return buildFromFutures(driver,
                          pp.preprocessAsync(opt.path, opt.vs),
                          pp.preprocessAsync(opt.path, opt.fs));
}

ProgramResult fromShaderUris(GlDriver& driver, SourceFetcher& fetcher,
                             const ProgramOptions& opt) {
  ShaderPreprocessor pp(fetcher, ExtensionSet::fromDriver(driver));
  return buildFromFutures(driver,
                          pp.loadAsync(opt.path + opt.vs),
                          pp.loadAsync(opt.path + opt.fs));
}

ProgramResult fromDefaultShaders(GlDriver& driver, const ProgramOptions& opt) {
  const std::string vsName = opt.vs.empty() ? "Default" : opt.vs;
  const std::string fsName = opt.fs.empty() ? "Default" : opt.fs;

  const char* vsSrc = findVertexShader(vsName);
  const char* fsSrc = findFragmentShader(fsName);
  if (!vsSrc || !fsSrc) {
    ProgramError err;
    err.code = ProgramErrc::IncludeLoad;
    err.path = vsSrc ? fsName : vsName;
    err.message = "no built-in " + std::string(vsSrc ? "fragment" : "vertex") +
                  " shader named " + err.path;
    std::fprintf(stderr, "ProgramLoader: %s\n", err.message.c_str());
    return failed(err);
  }

  MemorySourceFetcher library;
  addShaderChunks(library);

  ProgramOptions sources;
  sources.vs = vsSrc;
  sources.fs = fsSrc;
  return fromShaderSources(driver, library, sources);
}

ProgramResult fromManifest(GlDriver& driver, SourceFetcher& fetcher,
                           const ProgramManifest& manifest) {
  ProgramOptions opt;
  opt.path = manifest.path;
  opt.vs = manifest.vs;
  opt.fs = manifest.fs;

  ProgramResult r = fromShaderUris(driver, fetcher, opt);
  if (r.ok && !manifest.uniforms.empty()) {
    r.program->use();
    r.program->setUniforms(manifestUniformValues(manifest));
  }
  return r;
}

} // namespace luma
