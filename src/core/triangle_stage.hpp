#ifndef TRISTAGE_CORE_TRIANGLE_STAGE_HPP
#define TRISTAGE_CORE_TRIANGLE_STAGE_HPP

#include <cstdint>
#include <string>

#include <glm/glm.hpp>

#include "core/vertex.hpp"

namespace tristage::core {

// CPU mirror of shaders/triangle.{vert,frag} and shaders/procedural.{vert,frag}.

enum class PipelineMode {
    VertexBuffer,
    Procedural,
};

constexpr uint32_t kProceduralVertexCount = 3;

inline const FragmentColor kProceduralColor{0.0f, 0.2f, 0.2f, 1.0f};

// Lifts the position to homogeneous clip space (w = 1) and forwards the color.
VertexOutput TransformVertex(const Vertex& input);

// Opaque output: alpha is always 1 whatever the interpolated color is.
FragmentColor ColorizeFragment(const glm::vec3& color);

glm::vec4 ProceduralClipPosition(uint32_t vertexIndex);

std::string PipelineModeName(PipelineMode mode);
PipelineMode ParsePipelineMode(const std::string& name);

} // namespace tristage::core

#endif // TRISTAGE_CORE_TRIANGLE_STAGE_HPP
