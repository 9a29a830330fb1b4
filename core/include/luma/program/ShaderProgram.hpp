#pragma once
#include "luma/gl/GlDriver.hpp"
#include "luma/program/ProgramBinder.hpp"
#include "luma/program/ProgramError.hpp"
#include "luma/program/UniformValue.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace luma {

struct ProgramResult;

using UniformAssignments = std::vector<std::pair<std::string, UniformValue>>;

// A linked program plus its attribute locations and uniform setters.
// Only obtainable through build(), so an instance is always usable.
class ShaderProgram {
  struct Key { explicit Key() = default; };

public:
  ShaderProgram(Key, GlDriver& driver, GLuint program,
                AttributeMap attributes, UniformSetterMap uniforms);
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile both stages, link, and bind attributes/uniforms. On failure
  // every driver object created along the way is deleted.
  static ProgramResult build(GlDriver& driver,
                             const std::string& vertSrc,
                             const std::string& fragSrc);

  void use() const;

  // Unknown names are ignored.
  ShaderProgram& setUniform(const std::string& name, const UniformValue& value);
  ShaderProgram& setUniforms(const UniformAssignments& values);

  bool hasUniform(const std::string& name) const;
  UniformSetter* uniform(const std::string& name);

  // -1 if the attribute is not active.
  GLint attribLocation(const std::string& name) const;

  const AttributeMap& attributes() const { return attributes_; }
  const UniformSetterMap& uniforms() const { return uniforms_; }

  GLuint id() const { return program_; }
  GlDriver& driver() const { return *driver_; }

private:
  GlDriver* driver_;
  GLuint program_{0};
  AttributeMap attributes_;
  UniformSetterMap uniforms_;
};

struct ProgramResult {
  bool ok{true};
  ProgramError err{};
  std::unique_ptr<ShaderProgram> program;
};

} // namespace luma
