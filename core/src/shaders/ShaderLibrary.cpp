#include "luma/shaders/ShaderLibrary.hpp"

namespace luma {

// ---- shared chunks ----

static const char* kLightingChunk = R"GLSL(
const int LIGHT_MAX = 4;

uniform bool enableLights;
uniform vec3 ambientColor;
uniform vec3 directionalColor;
uniform vec3 lightingDirection;
uniform int numberPoints;
uniform vec3 pointLocation[LIGHT_MAX];
uniform vec3 pointColor[LIGHT_MAX];

vec3 computeLighting(vec3 position, vec3 normal) {
    if (!enableLights) return vec3(1.0);
    float dirWeight = max(dot(normal, -lightingDirection), 0.0);
    vec3 weight = ambientColor + directionalColor * dirWeight;
    for (int i = 0; i < LIGHT_MAX; i++) {
        if (i >= numberPoints) break;
        vec3 dir = normalize(pointLocation[i] - position);
        weight += pointColor[i] * max(dot(normal, dir), 0.0);
    }
    return weight;
}
)GLSL";

// ---- vertex ----

static const char* kDefaultVert = R"GLSL(#version 330 core
in vec3 position;
in vec3 normal;
in vec4 color;
in vec2 texCoord1;

uniform mat4 worldMatrix;
uniform mat4 projectionMatrix;
uniform mat4 worldInverseTransposeMatrix;

out vec4 vColor;
out vec2 vTexCoord;
out vec3 vLightWeighting;

#include "common/lighting.glsl"

void main() {
    vec4 mvPosition = worldMatrix * vec4(position, 1.0);
    vec3 n = normalize((worldInverseTransposeMatrix * vec4(normal, 0.0)).xyz);
    vLightWeighting = computeLighting(mvPosition.xyz, n);
    vColor = color;
    vTexCoord = texCoord1;
    gl_Position = projectionMatrix * mvPosition;
}
)GLSL";

// ---- fragment ----

static const char* kDefaultFrag = R"GLSL(#version 330 core
in vec4 vColor;
in vec2 vTexCoord;
in vec3 vLightWeighting;

uniform bool hasTexture1;
uniform sampler2D sampler1;

out vec4 fragColor;

void main() {
    vec4 base = hasTexture1 ? texture(sampler1, vTexCoord) : vColor;
    fragColor = vec4(base.rgb * vLightWeighting, base.a);
}
)GLSL";

static const char* kSolidFrag = R"GLSL(#version 330 core
uniform vec4 u_color;
out vec4 fragColor;

void main() {
    fragColor = u_color;
}
)GLSL";

const char* findVertexShader(const std::string& name) {
  if (name == "Default") return kDefaultVert;
  return nullptr;
}

const char* findFragmentShader(const std::string& name) {
  if (name == "Default") return kDefaultFrag;
  if (name == "Solid") return kSolidFrag;
  return nullptr;
}

void addShaderChunks(MemorySourceFetcher& fetcher) {
  fetcher.add("common/lighting.glsl", kLightingChunk);
}

} // namespace luma
