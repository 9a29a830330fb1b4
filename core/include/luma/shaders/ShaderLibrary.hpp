#pragma once
#include "luma/shaders/SourceFetcher.hpp"
#include <string>

namespace luma {

// Built-in GLSL sources. Returns nullptr for unknown names.
//   vertex:   "Default"
//   fragment: "Default", "Solid"
const char* findVertexShader(const std::string& name);
const char* findFragmentShader(const std::string& name);

// Register the shared chunks the built-in shaders #include
// ("common/lighting.glsl", ...) with a memory fetcher.
void addShaderChunks(MemorySourceFetcher& fetcher);

} // namespace luma
