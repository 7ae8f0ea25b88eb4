#ifndef TRISTAGE_CORE_REFERENCE_RASTERIZER_HPP
#define TRISTAGE_CORE_REFERENCE_RASTERIZER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

#include <glm/glm.hpp>

#include "core/triangle_stage.hpp"
#include "core/vertex.hpp"

namespace tristage::core {

/*
 * Software stand-in for the fixed-function part of the Vulkan pipeline the
 * application builds: triangle list, y-up clip space (flipped viewport),
 * counter-clockwise front faces with back faces culled, pixel centers at
 * (x + 0.5, y + 0.5) with a top-left fill rule, no blending.
 *
 * Used by the tests and by the headless --snapshot mode.
 */
class ReferenceRasterizer {
public:
    ReferenceRasterizer(uint32_t width, uint32_t height);

    void Clear(const FragmentColor& color);

    // Returns the number of fragments written.
    size_t Draw(PipelineMode mode, const std::vector<Vertex>& vertices);

    glm::vec2 ClipToFramebuffer(const glm::vec4& clipPosition) const;
    const FragmentColor& PixelAt(uint32_t x, uint32_t y) const;

    uint32_t Width() const { return width_; }
    uint32_t Height() const { return height_; }

    std::vector<uint8_t> ToRgba8() const;
    void WritePpm(const std::filesystem::path& path) const;

private:
    using FragmentShader = std::function<FragmentColor(const glm::vec3& color)>;

    size_t RasterizeTriangle(const VertexOutput& a, const VertexOutput& b, const VertexOutput& c,
                             const FragmentShader& shade);

    uint32_t width_;
    uint32_t height_;
    std::vector<FragmentColor> pixels_;
};

} // namespace tristage::core

#endif // TRISTAGE_CORE_REFERENCE_RASTERIZER_HPP
