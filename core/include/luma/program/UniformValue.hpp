#pragma once
#include <glad/gl.h>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <vector>

namespace luma {

// What a uniform setter accepts: a scalar, or a flat run of floats / ints.
// Array forms are copied, so a value (and a UniformAssignments list built
// from braced literals) stays valid after its source goes out of scope.
// Any type with `std::vector<float> flatten() const` (matrix and vector
// math types) converts too.
class UniformValue {
public:
  UniformValue(float v) : storage_(Storage::FloatScalar), f_(v) {}
  UniformValue(double v) : storage_(Storage::FloatScalar), f_(static_cast<float>(v)) {}
  UniformValue(int v) : storage_(Storage::IntScalar), i_(v) {}
  UniformValue(bool v) : storage_(Storage::IntScalar), i_(v ? 1 : 0) {}

  UniformValue(const float* data, std::size_t count)
    : storage_(Storage::FloatArray), floats_(data, data + count) {}
  UniformValue(const GLint* data, std::size_t count)
    : storage_(Storage::IntArray), ints_(data, data + count) {}

  UniformValue(std::initializer_list<float> list)
    : storage_(Storage::FloatArray), floats_(list) {}
  UniformValue(std::vector<float> v)
    : storage_(Storage::FloatArray), floats_(std::move(v)) {}
  UniformValue(std::vector<GLint> v)
    : storage_(Storage::IntArray), ints_(std::move(v)) {}

  template <std::size_t N>
  UniformValue(const float (&a)[N]) : UniformValue(a, N) {}
  template <std::size_t N>
  UniformValue(const GLint (&a)[N]) : UniformValue(a, N) {}
  template <std::size_t N>
  UniformValue(const std::array<float, N>& a) : UniformValue(a.data(), N) {}

  template <typename T,
            typename = std::enable_if_t<std::is_same<
                decltype(std::declval<const T&>().flatten()), std::vector<float>>::value>>
  UniformValue(const T& v)
    : storage_(Storage::FloatArray), floats_(v.flatten()) {}

  // Number of scalars carried.
  std::size_t size() const {
    switch (storage_) {
      case Storage::FloatArray: return floats_.size();
      case Storage::IntArray:   return ints_.size();
      default:                  return 1;
    }
  }

  float floatAt(std::size_t i) const;
  GLint intAt(std::size_t i) const;

private:
  enum class Storage { FloatScalar, IntScalar, FloatArray, IntArray };

  Storage storage_;
  float f_{0.0f};
  GLint i_{0};
  std::vector<float> floats_;
  std::vector<GLint> ints_;
};

inline float UniformValue::floatAt(std::size_t i) const {
  switch (storage_) {
    case Storage::FloatScalar: return f_;
    case Storage::IntScalar:   return static_cast<float>(i_);
    case Storage::FloatArray:  return floats_[i];
    case Storage::IntArray:    return static_cast<float>(ints_[i]);
  }
  return 0.0f;
}

inline GLint UniformValue::intAt(std::size_t i) const {
  switch (storage_) {
    case Storage::FloatScalar: return static_cast<GLint>(f_);
    case Storage::IntScalar:   return i_;
    case Storage::FloatArray:  return static_cast<GLint>(floats_[i]);
    case Storage::IntArray:    return ints_[i];
  }
  return 0;
}

} // namespace luma
