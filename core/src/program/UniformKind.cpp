#include "luma/program/UniformKind.hpp"

namespace luma {

bool classifyUniformType(GLenum type, UniformKind& out) {
  switch (type) {
    case GL_FLOAT:
      out = UniformKind::Float; return true;

    case GL_INT:
    case GL_BOOL:
      out = UniformKind::Int; return true;

    // Every sampler is bound by texture unit index.
    case GL_SAMPLER_1D:
    case GL_SAMPLER_2D:
    case GL_SAMPLER_3D:
    case GL_SAMPLER_CUBE:
    case GL_SAMPLER_1D_SHADOW:
    case GL_SAMPLER_2D_SHADOW:
    case GL_SAMPLER_1D_ARRAY:
    case GL_SAMPLER_2D_ARRAY:
    case GL_SAMPLER_1D_ARRAY_SHADOW:
    case GL_SAMPLER_2D_ARRAY_SHADOW:
    case GL_SAMPLER_2D_MULTISAMPLE:
    case GL_SAMPLER_2D_MULTISAMPLE_ARRAY:
    case GL_SAMPLER_CUBE_SHADOW:
    case GL_SAMPLER_BUFFER:
    case GL_SAMPLER_2D_RECT:
    case GL_SAMPLER_2D_RECT_SHADOW:
    case GL_INT_SAMPLER_1D:
    case GL_INT_SAMPLER_2D:
    case GL_INT_SAMPLER_3D:
    case GL_INT_SAMPLER_CUBE:
    case GL_INT_SAMPLER_1D_ARRAY:
    case GL_INT_SAMPLER_2D_ARRAY:
    case GL_INT_SAMPLER_2D_MULTISAMPLE:
    case GL_INT_SAMPLER_2D_MULTISAMPLE_ARRAY:
    case GL_INT_SAMPLER_BUFFER:
    case GL_INT_SAMPLER_2D_RECT:
    case GL_UNSIGNED_INT_SAMPLER_1D:
    case GL_UNSIGNED_INT_SAMPLER_2D:
    case GL_UNSIGNED_INT_SAMPLER_3D:
    case GL_UNSIGNED_INT_SAMPLER_CUBE:
    case GL_UNSIGNED_INT_SAMPLER_1D_ARRAY:
    case GL_UNSIGNED_INT_SAMPLER_2D_ARRAY:
    case GL_UNSIGNED_INT_SAMPLER_2D_MULTISAMPLE:
    case GL_UNSIGNED_INT_SAMPLER_2D_MULTISAMPLE_ARRAY:
    case GL_UNSIGNED_INT_SAMPLER_BUFFER:
    case GL_UNSIGNED_INT_SAMPLER_2D_RECT:
      out = UniformKind::Int; return true;

    case GL_FLOAT_VEC2: out = UniformKind::FloatVec2; return true;
    case GL_FLOAT_VEC3: out = UniformKind::FloatVec3; return true;
    case GL_FLOAT_VEC4: out = UniformKind::FloatVec4; return true;

    case GL_INT_VEC2:
    case GL_BOOL_VEC2:
      out = UniformKind::IntVec2; return true;
    case GL_INT_VEC3:
    case GL_BOOL_VEC3:
      out = UniformKind::IntVec3; return true;
    case GL_INT_VEC4:
    case GL_BOOL_VEC4:
      out = UniformKind::IntVec4; return true;

    case GL_FLOAT_MAT2: out = UniformKind::FloatMat2; return true;
    case GL_FLOAT_MAT3: out = UniformKind::FloatMat3; return true;
    case GL_FLOAT_MAT4: out = UniformKind::FloatMat4; return true;

    default:
      return false;
  }
}

int componentCount(UniformKind kind) {
  switch (kind) {
    case UniformKind::Float:
    case UniformKind::Int:       return 1;
    case UniformKind::FloatVec2:
    case UniformKind::IntVec2:   return 2;
    case UniformKind::FloatVec3:
    case UniformKind::IntVec3:   return 3;
    case UniformKind::FloatVec4:
    case UniformKind::IntVec4:
    case UniformKind::FloatMat2: return 4;
    case UniformKind::FloatMat3: return 9;
    case UniformKind::FloatMat4: return 16;
  }
  return 1;
}

bool isFloatKind(UniformKind kind) {
  switch (kind) {
    case UniformKind::Int:
    case UniformKind::IntVec2:
    case UniformKind::IntVec3:
    case UniformKind::IntVec4:
      return false;
    default:
      return true;
  }
}

bool isMatrixKind(UniformKind kind) {
  return kind == UniformKind::FloatMat2 ||
         kind == UniformKind::FloatMat3 ||
         kind == UniformKind::FloatMat4;
}

const char* uniformKindName(UniformKind kind) {
  switch (kind) {
    case UniformKind::Float:     return "float";
    case UniformKind::Int:       return "int";
    case UniformKind::FloatVec2: return "vec2";
    case UniformKind::FloatVec3: return "vec3";
    case UniformKind::FloatVec4: return "vec4";
    case UniformKind::IntVec2:   return "ivec2";
    case UniformKind::IntVec3:   return "ivec3";
    case UniformKind::IntVec4:   return "ivec4";
    case UniformKind::FloatMat2: return "mat2";
    case UniformKind::FloatMat3: return "mat3";
    case UniformKind::FloatMat4: return "mat4";
  }
  return "unknown";
}

} // namespace luma
