#include "core/triangle_stage.hpp"

#include <stdexcept>

namespace tristage::core {

VertexOutput TransformVertex(const Vertex& input) {
    VertexOutput output{};
    output.clipPosition = glm::vec4(input.position[0], input.position[1], input.position[2], 1.0f);
    output.color = glm::vec3(input.color[0], input.color[1], input.color[2]);
    return output;
}

FragmentColor ColorizeFragment(const glm::vec3& color) {
    return FragmentColor(color, 1.0f);
}

glm::vec4 ProceduralClipPosition(uint32_t vertexIndex) {
    float x = static_cast<float>(1 - static_cast<int32_t>(vertexIndex)) * 0.5f;
    float y = static_cast<float>(static_cast<int32_t>(vertexIndex & 1u) * 2 - 1) * 0.5f;
    return glm::vec4(x, y, 0.0f, 1.0f);
}

std::string PipelineModeName(PipelineMode mode) {
    switch (mode) {
        case PipelineMode::VertexBuffer: return "vertex_buffer";
        case PipelineMode::Procedural: return "procedural";
    }
    return "unknown";
}

PipelineMode ParsePipelineMode(const std::string& name) {
    if (name == "vertex_buffer") {
        return PipelineMode::VertexBuffer;
    }
    if (name == "procedural") {
        return PipelineMode::Procedural;
    }
    throw std::runtime_error("Unknown pipeline mode '" + name + "' (expected vertex_buffer or procedural)");
}

} // namespace tristage::core
