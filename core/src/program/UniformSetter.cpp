#include "luma/program/UniformSetter.hpp"
#include <algorithm>

namespace luma {

UniformSetter::UniformSetter(GlDriver& driver, GLint location, UniformKind kind,
                             bool isArray, GLint arraySize)
  : driver_(&driver), loc_(location), kind_(kind), array_(isArray),
    arraySize_(arraySize > 0 ? arraySize : 1) {
  const int comps = componentCount(kind_);
  if (!array_ && comps == 1) return;  // uniform1f / uniform1i take the value directly

  std::size_t n = static_cast<std::size_t>(comps) *
                  static_cast<std::size_t>(array_ ? arraySize_ : 1);
  if (isFloatKind(kind_)) {
    floatScratch_.assign(n, 0.0f);
  } else {
    intScratch_.assign(n, 0);
  }
}

void UniformSetter::operator()(const UniformValue& value) {
  const std::size_t n = value.size();
  if (n == 0) return;

  const std::size_t comps = static_cast<std::size_t>(componentCount(kind_));

  if (!array_ && comps == 1) {
    if (kind_ == UniformKind::Float) {
      driver_->uniform1f(loc_, value.floatAt(0));
    } else {
      driver_->uniform1i(loc_, value.intAt(0));
    }
    return;
  }

  std::size_t elements = 1;
  if (array_) {
    elements = std::min(static_cast<std::size_t>(arraySize_), (n + comps - 1) / comps);
  }
  const std::size_t total = elements * comps;
  const std::size_t copy = std::min(n, total);

  if (isFloatKind(kind_)) {
    for (std::size_t i = 0; i < copy; i++) floatScratch_[i] = value.floatAt(i);
    std::fill(floatScratch_.begin() + static_cast<std::ptrdiff_t>(copy),
              floatScratch_.begin() + static_cast<std::ptrdiff_t>(total), 0.0f);
    uploadFloats(static_cast<GLsizei>(elements));
  } else {
    for (std::size_t i = 0; i < copy; i++) intScratch_[i] = value.intAt(i);
    std::fill(intScratch_.begin() + static_cast<std::ptrdiff_t>(copy),
              intScratch_.begin() + static_cast<std::ptrdiff_t>(total), 0);
    uploadInts(static_cast<GLsizei>(elements));
  }
}

void UniformSetter::uploadFloats(GLsizei count) {
  const GLfloat* v = floatScratch_.data();
  switch (kind_) {
    case UniformKind::Float:     driver_->uniform1fv(loc_, count, v); break;
    case UniformKind::FloatVec2: driver_->uniform2fv(loc_, count, v); break;
    case UniformKind::FloatVec3: driver_->uniform3fv(loc_, count, v); break;
    case UniformKind::FloatVec4: driver_->uniform4fv(loc_, count, v); break;
    // Column-major input; GL must not transpose.
    case UniformKind::FloatMat2: driver_->uniformMatrix2fv(loc_, count, GL_FALSE, v); break;
    case UniformKind::FloatMat3: driver_->uniformMatrix3fv(loc_, count, GL_FALSE, v); break;
    case UniformKind::FloatMat4: driver_->uniformMatrix4fv(loc_, count, GL_FALSE, v); break;
    case UniformKind::Int:
    case UniformKind::IntVec2:
    case UniformKind::IntVec3:
    case UniformKind::IntVec4:
      break;
  }
}

void UniformSetter::uploadInts(GLsizei count) {
  const GLint* v = intScratch_.data();
  switch (kind_) {
    case UniformKind::Int:     driver_->uniform1iv(loc_, count, v); break;
    case UniformKind::IntVec2: driver_->uniform2iv(loc_, count, v); break;
    case UniformKind::IntVec3: driver_->uniform3iv(loc_, count, v); break;
    case UniformKind::IntVec4: driver_->uniform4iv(loc_, count, v); break;
    case UniformKind::Float:
    case UniformKind::FloatVec2:
    case UniformKind::FloatVec3:
    case UniformKind::FloatVec4:
    case UniformKind::FloatMat2:
    case UniformKind::FloatMat3:
    case UniformKind::FloatMat4:
      break;
  }
}

} // namespace luma
