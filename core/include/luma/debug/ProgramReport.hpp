#pragma once
#include "luma/program/ShaderProgram.hpp"
#include <string>

namespace luma {

// JSON summary of a program (for logging / tests / luma_inspect):
//   {"ok":true,"program":3,
//    "attributes":[{"name":"position","location":0}, ...],
//    "uniforms":[{"name":"pointColor","kind":"vec3","array":true,"size":4,"location":7}, ...]}
// Entries are sorted by name.
std::string programReportJson(const ShaderProgram& program);

// Same for a failed build: {"ok":false,"code":"...","message":"...","path":"..."}
std::string programErrorJson(const ProgramError& err);

} // namespace luma
