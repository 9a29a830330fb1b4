#pragma once
#include "luma/gl/GlDriver.hpp"
#include "luma/program/ProgramError.hpp"
#include "luma/program/UniformSetter.hpp"
#include <string>
#include <unordered_map>

namespace luma {

using AttributeMap = std::unordered_map<std::string, GLint>;
using UniformSetterMap = std::unordered_map<std::string, UniformSetter>;

struct BindResult {
  bool ok{true};
  ProgramError err{};
  AttributeMap attributes;
  UniformSetterMap uniforms;
};

// "u_lights[0]" -> "u_lights"; names without a trailing index are returned
// unchanged.
std::string uniformBaseName(const std::string& reportedName);

// Introspect a linked program: attribute name -> location, and one setter
// per active uniform. Fails as a whole on the first uniform whose type is
// outside the UniformKind table; no partial maps are returned.
BindResult bindProgram(GlDriver& driver, GLuint program);

} // namespace luma
