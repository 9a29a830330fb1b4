#pragma once
#include "luma/config/ProgramManifest.hpp"
#include "luma/gl/GlDriver.hpp"
#include "luma/program/ShaderProgram.hpp"
#include "luma/shaders/SourceFetcher.hpp"
#include <string>

namespace luma {

struct ProgramOptions {
  std::string path;  // base directory, with trailing '/'
  std::string vs;    // vertex source, URI or library name (depends on the loader)
  std::string fs;    // fragment source, URI or library name
};

// Alternate ways of building a ShaderProgram. Each one preprocesses both
// stages (includes + HAS_EXTENSION, vertex and fragment in parallel) and
// then builds on the calling thread, which must own the GL context.

// opt.vs / opt.fs are GLSL text; includes resolve against opt.path.
ProgramResult fromShaderSources(GlDriver& driver, SourceFetcher& fetcher,
                                const ProgramOptions& opt);

// opt.path + opt.vs / opt.path + opt.fs are fetched, each stage resolving
// its includes relative to its own URI.
ProgramResult fromShaderUris(GlDriver& driver, SourceFetcher& fetcher,
                             const ProgramOptions& opt);

// opt.vs / opt.fs name built-in library shaders ("Default" if empty).
ProgramResult fromDefaultShaders(GlDriver& driver, const ProgramOptions& opt = {});

// fromShaderUris, then uses the program and applies the manifest's uniforms.
ProgramResult fromManifest(GlDriver& driver, SourceFetcher& fetcher,
                           const ProgramManifest& manifest);

} // namespace luma
