#ifndef TRISTAGE_CORE_VERTEX_LAYOUT_HPP
#define TRISTAGE_CORE_VERTEX_LAYOUT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tristage::core {

constexpr uint32_t kPositionLocation = 0;
constexpr uint32_t kColorLocation = 1;

enum class VertexFormat {
    Float32x2,
    Float32x3,
    Float32x4,
};

struct VertexAttribute {
    uint32_t location = 0;
    VertexFormat format = VertexFormat::Float32x3;
    uint32_t offset = 0;
};

struct VertexBufferLayout {
    uint32_t stride = 0;
    std::vector<VertexAttribute> attributes;
};

uint32_t FormatSize(VertexFormat format);
std::string FormatName(VertexFormat format);

// Layout matching core::Vertex.
VertexBufferLayout DescribeVertexBuffer();

// Throws std::runtime_error when the layout disagrees with what the vertex
// stage reads at locations 0 and 1.
void ValidateVertexBufferLayout(const VertexBufferLayout& layout);

} // namespace tristage::core

#endif // TRISTAGE_CORE_VERTEX_LAYOUT_HPP
