#ifndef TRISTAGE_CORE_VERTEX_HPP
#define TRISTAGE_CORE_VERTEX_HPP

#include <array>
#include <cstddef>

#include <glm/glm.hpp>

namespace tristage::core {

// Per-vertex record as it sits in the vertex buffer.
// location 0 = position, location 1 = color.
struct Vertex {
    std::array<float, 3> position;
    std::array<float, 3> color;
};

static_assert(sizeof(Vertex) == sizeof(float) * 6, "vertex must be tightly packed");
static_assert(offsetof(Vertex, position) == 0, "position must sit at offset 0");
static_assert(offsetof(Vertex, color) == sizeof(float) * 3, "color must follow position");

struct VertexOutput {
    glm::vec4 clipPosition;
    glm::vec3 color;
};

using FragmentColor = glm::vec4;

} // namespace tristage::core

#endif // TRISTAGE_CORE_VERTEX_HPP
