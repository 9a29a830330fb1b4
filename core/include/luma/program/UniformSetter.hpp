#pragma once
#include "luma/gl/GlDriver.hpp"
#include "luma/program/UniformKind.hpp"
#include "luma/program/UniformValue.hpp"
#include <cstddef>
#include <vector>

namespace luma {

// Uploads values to one uniform location. Non-scalar setters own a scratch
// buffer of componentCount(kind) * arraySize scalars that every call
// overwrites; not safe to call from several threads.
class UniformSetter {
public:
  UniformSetter(GlDriver& driver, GLint location, UniformKind kind,
                bool isArray, GLint arraySize);

  // Missing trailing components are written as zero. Array setters upload
  // as many whole elements as the value covers (capped at arraySize);
  // an empty value uploads nothing.
  void operator()(const UniformValue& value);

  UniformKind kind() const { return kind_; }
  bool isArray() const { return array_; }
  GLint arraySize() const { return arraySize_; }
  GLint location() const { return loc_; }

  // Capacity of the scratch buffer in scalars (0 for plain scalars).
  std::size_t scratchSize() const { return floatScratch_.size() + intScratch_.size(); }

private:
  GlDriver* driver_;
  GLint loc_;
  UniformKind kind_;
  bool array_;
  GLint arraySize_;

  std::vector<GLfloat> floatScratch_;
  std::vector<GLint> intScratch_;

  void uploadFloats(GLsizei count);
  void uploadInts(GLsizei count);
};

} // namespace luma
