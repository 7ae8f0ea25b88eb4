#include "core/vertex_layout.hpp"

#include "core/vertex.hpp"

#include <cstddef>
#include <set>
#include <stdexcept>

namespace tristage::core {

namespace {

const VertexAttribute* FindAttribute(const VertexBufferLayout& layout, uint32_t location) {
    for (const auto& attribute : layout.attributes) {
        if (attribute.location == location) {
            return &attribute;
        }
    }
    return nullptr;
}

void RequireFloat3(const VertexBufferLayout& layout, uint32_t location, const char* name) {
    const VertexAttribute* attribute = FindAttribute(layout, location);
    if (!attribute) {
        throw std::runtime_error("Vertex layout is missing the " + std::string(name) +
                                 " attribute at location " + std::to_string(location));
    }
    if (attribute->format != VertexFormat::Float32x3) {
        throw std::runtime_error("Vertex attribute '" + std::string(name) + "' must be Float32x3, got " +
                                 FormatName(attribute->format));
    }
}

} // namespace

uint32_t FormatSize(VertexFormat format) {
    switch (format) {
        case VertexFormat::Float32x2: return sizeof(float) * 2;
        case VertexFormat::Float32x3: return sizeof(float) * 3;
        case VertexFormat::Float32x4: return sizeof(float) * 4;
    }
    throw std::runtime_error("Unknown vertex format");
}

std::string FormatName(VertexFormat format) {
    switch (format) {
        case VertexFormat::Float32x2: return "Float32x2";
        case VertexFormat::Float32x3: return "Float32x3";
        case VertexFormat::Float32x4: return "Float32x4";
    }
    return "unknown";
}

VertexBufferLayout DescribeVertexBuffer() {
    VertexBufferLayout layout;
    layout.stride = static_cast<uint32_t>(sizeof(Vertex));
    layout.attributes = {
        {kPositionLocation, VertexFormat::Float32x3, static_cast<uint32_t>(offsetof(Vertex, position))},
        {kColorLocation, VertexFormat::Float32x3, static_cast<uint32_t>(offsetof(Vertex, color))},
    };
    return layout;
}

void ValidateVertexBufferLayout(const VertexBufferLayout& layout) {
    if (layout.stride == 0 || layout.stride % sizeof(float) != 0) {
        throw std::runtime_error("Vertex stride must be a positive multiple of 4, got " +
                                 std::to_string(layout.stride));
    }

    std::set<uint32_t> seenLocations;
    for (const auto& attribute : layout.attributes) {
        if (!seenLocations.insert(attribute.location).second) {
            throw std::runtime_error("Vertex location " + std::to_string(attribute.location) +
                                     " is declared more than once");
        }
        if (attribute.offset + FormatSize(attribute.format) > layout.stride) {
            throw std::runtime_error("Vertex attribute at location " + std::to_string(attribute.location) +
                                     " overruns the stride of " + std::to_string(layout.stride) + " bytes");
        }
    }

    RequireFloat3(layout, kPositionLocation, "position");
    RequireFloat3(layout, kColorLocation, "color");
}

} // namespace tristage::core
