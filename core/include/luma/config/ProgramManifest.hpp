#pragma once
#include "luma/program/ShaderProgram.hpp"
#include <string>
#include <vector>

namespace luma {

struct ManifestUniform {
  std::string name;
  std::vector<float> values;  // bools as 0 / 1
};

// JSON description of a program:
//   {
//     "path": "shaders/",          // prefixed to vs and fs
//     "vs": "lit.vs.glsl",
//     "fs": "lit.fs.glsl",
//     "noCache": true,             // accepted; sources are never cached
//     "uniforms": { "u_color": [1, 0, 0, 1], "u_time": 0.5, "enableLights": true }
//   }
struct ProgramManifest {
  std::string path;
  std::string vs;
  std::string fs;
  bool noCache{false};
  std::vector<ManifestUniform> uniforms;
};

// Returns false with a reason in `err` on malformed input.
bool parseProgramManifest(const std::string& json, ProgramManifest& out, std::string& err);

// Copies of the manifest's default uniform values.
UniformAssignments manifestUniformValues(const ProgramManifest& manifest);

} // namespace luma
