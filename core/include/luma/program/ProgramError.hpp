#pragma once
#include <cstdint>
#include <string>

namespace luma {

enum class ProgramErrc : std::uint8_t {
  None,
  ShaderCompile,
  ProgramLink,
  UnknownUniformType,
  RecursiveInclude,
  IncludeLoad
};

struct ProgramError {
  ProgramErrc code{ProgramErrc::None};
  std::string message;  // human text, includes the driver log where there is one
  std::string path;     // offending include / shader URI, or the uniform name
};

// Stable string code, e.g. "SHADER_COMPILE_ERROR".
inline const char* errcName(ProgramErrc code) {
  switch (code) {
    case ProgramErrc::None:               return "OK";
    case ProgramErrc::ShaderCompile:      return "SHADER_COMPILE_ERROR";
    case ProgramErrc::ProgramLink:        return "PROGRAM_LINK_ERROR";
    case ProgramErrc::UnknownUniformType: return "UNKNOWN_UNIFORM_TYPE";
    case ProgramErrc::RecursiveInclude:   return "RECURSIVE_INCLUDE";
    case ProgramErrc::IncludeLoad:        return "INCLUDE_LOAD_ERROR";
  }
  return "UNKNOWN";
}

} // namespace luma
