#pragma once
#include <glad/gl.h>
#include <cstdint>

namespace luma {

// Closed set of uniform shapes the binder knows how to upload.
enum class UniformKind : std::uint8_t {
  Float,
  Int,        // int, bool and sampler types
  FloatVec2,
  FloatVec3,
  FloatVec4,
  IntVec2,    // ivecN and bvecN
  IntVec3,
  IntVec4,
  FloatMat2,
  FloatMat3,
  FloatMat4
};

// Map a GL type tag to its kind. Returns false for tags outside the table
// (unsigned, double, non-square matrices, image types, ...).
bool classifyUniformType(GLenum type, UniformKind& out);

// Scalars per element: 1, 2, 3, 4, 4, 9 or 16.
int componentCount(UniformKind kind);

bool isFloatKind(UniformKind kind);
bool isMatrixKind(UniformKind kind);

// "float", "ivec3", "mat4", ...
const char* uniformKindName(UniformKind kind);

} // namespace luma
