#include "core/reference_rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using tristage::core::FragmentColor;
using tristage::core::PipelineMode;
using tristage::core::ReferenceRasterizer;
using tristage::core::Vertex;

constexpr uint32_t kSize = 64;
const FragmentColor kClear{0.1f, 0.2f, 0.3f, 1.0f};

void Assert(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "test failure: " << message << '\n';
        ++failures;
    }
}

bool ApproximatelyEqual(float a, float b, float eps) {
    return std::fabs(a - b) <= eps;
}

bool SameColor(const FragmentColor& a, const FragmentColor& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

std::vector<Vertex> RgbTriangle() {
    return {
        {{0.0f, 0.5f, 0.0f}, {1.0f, 0.0f, 0.0f}},
        {{-0.5f, -0.5f, 0.0f}, {0.0f, 1.0f, 0.0f}},
        {{0.5f, -0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}},
    };
}

void TestInterpolatedColors(int& failures) {
    ReferenceRasterizer rasterizer(kSize, kSize);
    rasterizer.Clear(kClear);
    size_t fragments = rasterizer.Draw(PipelineMode::VertexBuffer, RgbTriangle());
    // Ideal coverage of the 32 x 32 right triangle is 512 pixels.
    Assert(fragments > 400 && fragments < 620, "fragment count should match the triangle area, got " +
           std::to_string(fragments), failures);

    // Centroid lands at framebuffer (32, 37.33).
    const auto& center = rasterizer.PixelAt(32, 37);
    Assert(ApproximatelyEqual(center.r, 1.0f / 3.0f, 0.05f) && ApproximatelyEqual(center.g, 1.0f / 3.0f, 0.05f) &&
               ApproximatelyEqual(center.b, 1.0f / 3.0f, 0.05f),
           "center pixel should be close to the barycentric average", failures);
    Assert(center.a == 1.0f, "center pixel alpha must be 1", failures);

    const auto& top = rasterizer.PixelAt(32, 18);
    Assert(top.r > 0.85f && top.g < 0.15f && top.b < 0.15f, "top corner should approach red", failures);
    const auto& left = rasterizer.PixelAt(17, 46);
    Assert(left.g > 0.85f && left.r < 0.15f && left.b < 0.15f, "bottom-left corner should approach green", failures);
    const auto& right = rasterizer.PixelAt(46, 46);
    Assert(right.b > 0.85f && right.r < 0.15f && right.g < 0.15f, "bottom-right corner should approach blue",
           failures);

    Assert(SameColor(rasterizer.PixelAt(0, 0), kClear), "uncovered pixel keeps the clear color", failures);
    Assert(SameColor(rasterizer.PixelAt(kSize - 1, kSize - 1), kClear), "uncovered corner keeps the clear color",
           failures);
}

void TestProceduralTriangle(int& failures) {
    ReferenceRasterizer rasterizer(kSize, kSize);
    rasterizer.Clear(kClear);
    size_t fragments = rasterizer.Draw(PipelineMode::Procedural, {});
    Assert(fragments > 400 && fragments < 620, "procedural triangle should cover its area", failures);

    size_t procedural = 0;
    for (uint32_t y = 0; y < kSize; ++y) {
        for (uint32_t x = 0; x < kSize; ++x) {
            const auto& pixel = rasterizer.PixelAt(x, y);
            if (SameColor(pixel, tristage::core::kProceduralColor)) {
                ++procedural;
            } else if (!SameColor(pixel, kClear)) {
                Assert(false, "pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                       ") is neither the procedural nor the clear color", failures);
            }
        }
    }
    Assert(procedural == fragments, "every written fragment is exactly (0, 0.2, 0.2, 1)", failures);
    Assert(SameColor(rasterizer.PixelAt(32, 37), tristage::core::kProceduralColor),
           "procedural triangle covers the centroid", failures);
}

void TestIdempotentDraws(int& failures) {
    ReferenceRasterizer first(kSize, kSize);
    first.Clear(kClear);
    first.Draw(PipelineMode::VertexBuffer, RgbTriangle());
    auto once = first.ToRgba8();

    first.Draw(PipelineMode::VertexBuffer, RgbTriangle());
    Assert(first.ToRgba8() == once, "redrawing over the same frame must not accumulate", failures);

    ReferenceRasterizer second(kSize, kSize);
    second.Clear(kClear);
    second.Draw(PipelineMode::VertexBuffer, RgbTriangle());
    Assert(second.ToRgba8() == once, "identical draws must be byte-identical", failures);
    Assert(once.size() == static_cast<size_t>(kSize) * kSize * 4, "RGBA8 readback size", failures);
}

void TestBackFacesCulled(int& failures) {
    auto triangle = RgbTriangle();
    std::swap(triangle[1], triangle[2]);
    ReferenceRasterizer rasterizer(kSize, kSize);
    rasterizer.Clear(kClear);
    Assert(rasterizer.Draw(PipelineMode::VertexBuffer, triangle) == 0, "clockwise triangle must be culled",
           failures);
    Assert(SameColor(rasterizer.PixelAt(32, 37), kClear), "culled triangle leaves the frame cleared", failures);
}

void TestSharedEdgeCoverage(int& failures) {
    // Two triangles tiling the whole viewport: the diagonal is shared.
    const std::vector<Vertex> quad = {
        {{-1.0f, -1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{1.0f, -1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{1.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{-1.0f, -1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{1.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{-1.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}},
    };
    ReferenceRasterizer rasterizer(kSize, kSize);
    size_t fragments = rasterizer.Draw(PipelineMode::VertexBuffer, quad);
    Assert(fragments == static_cast<size_t>(kSize) * kSize,
           "full-screen quad should touch every pixel exactly once, got " + std::to_string(fragments), failures);
}

void TestPrimitiveAssembly(int& failures) {
    ReferenceRasterizer reference(kSize, kSize);
    size_t expected = reference.Draw(PipelineMode::VertexBuffer, RgbTriangle());

    auto withTrailing = RgbTriangle();
    withTrailing.push_back({{0.9f, 0.9f, 0.0f}, {1.0f, 1.0f, 1.0f}});
    ReferenceRasterizer rasterizer(kSize, kSize);
    Assert(rasterizer.Draw(PipelineMode::VertexBuffer, withTrailing) == expected,
           "trailing vertices that do not form a triangle are dropped", failures);
    Assert(rasterizer.Draw(PipelineMode::VertexBuffer, {}) == 0, "empty draw writes nothing", failures);
}

void TestDepthRange(int& failures) {
    for (float z : {-0.5f, 1.5f}) {
        auto triangle = RgbTriangle();
        for (auto& vertex : triangle) {
            vertex.position[2] = z;
        }
        ReferenceRasterizer rasterizer(kSize, kSize);
        Assert(rasterizer.Draw(PipelineMode::VertexBuffer, triangle) == 0,
               "fragments outside the depth range are discarded", failures);
    }
}

void TestFarOffscreenVertex(int& failures) {
    // One corner sits far to the right; the visible part is roughly the
    // rectangle x in [16, 64), y in [16, 48).
    const std::vector<Vertex> triangle = {
        {{-0.5f, -0.5f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{1e10f, -0.5f, 0.0f}, {1.0f, 1.0f, 1.0f}},
        {{-0.5f, 0.5f, 0.0f}, {1.0f, 1.0f, 1.0f}},
    };
    ReferenceRasterizer rasterizer(kSize, kSize);
    rasterizer.Clear(kClear);
    size_t fragments = rasterizer.Draw(PipelineMode::VertexBuffer, triangle);
    Assert(fragments > 1400 && fragments <= 48 * 32,
           "on-screen part of a huge triangle should be covered, got " + std::to_string(fragments), failures);

    const auto& inside = rasterizer.PixelAt(40, 30);
    Assert(inside.r > 0.99f && inside.g > 0.99f && inside.b > 0.99f, "interior pixel is covered", failures);
    Assert(rasterizer.PixelAt(63, 32).r > 0.99f, "coverage reaches the right border", failures);
    Assert(SameColor(rasterizer.PixelAt(10, 30), kClear), "left of the triangle stays clear", failures);
    Assert(SameColor(rasterizer.PixelAt(40, 50), kClear), "below the triangle stays clear", failures);
}

void TestNonFinitePositions(int& failures) {
    for (float bad : {std::nanf(""), std::numeric_limits<float>::infinity()}) {
        auto triangle = RgbTriangle();
        triangle[0].position[0] = bad;
        ReferenceRasterizer rasterizer(kSize, kSize);
        rasterizer.Clear(kClear);
        Assert(rasterizer.Draw(PipelineMode::VertexBuffer, triangle) == 0,
               "non-finite positions produce no fragments", failures);
        Assert(SameColor(rasterizer.PixelAt(32, 37), kClear), "frame is untouched", failures);
    }
}

void TestViewportMapping(int& failures) {
    ReferenceRasterizer rasterizer(kSize, kSize);
    auto center = rasterizer.ClipToFramebuffer(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    Assert(center.x == 32.0f && center.y == 32.0f, "clip origin maps to the framebuffer center", failures);
    auto topLeft = rasterizer.ClipToFramebuffer(glm::vec4(-2.0f, 2.0f, 0.0f, 2.0f));
    Assert(topLeft.x == 0.0f && topLeft.y == 0.0f, "(-1, 1) in NDC maps to the top-left corner", failures);
}

void TestErrors(int& failures) {
    bool threw = false;
    try {
        ReferenceRasterizer empty(0, kSize);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Assert(threw, "zero-sized framebuffer should throw", failures);

    threw = false;
    ReferenceRasterizer rasterizer(kSize, kSize);
    try {
        rasterizer.PixelAt(kSize, 0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    Assert(threw, "reading past the framebuffer should throw", failures);
}

void TestPpmOutput(int& failures) {
    auto outputPath = std::filesystem::temp_directory_path() / "tristage_rasterizer_test" / "frame.ppm";
    std::filesystem::remove_all(outputPath.parent_path());

    ReferenceRasterizer rasterizer(kSize, kSize);
    rasterizer.Clear(kClear);
    rasterizer.Draw(PipelineMode::VertexBuffer, RgbTriangle());
    rasterizer.WritePpm(outputPath);

    std::ifstream input(outputPath, std::ios::binary);
    Assert(static_cast<bool>(input), "snapshot file should exist", failures);
    std::vector<char> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    const std::string header = "P6\n64 64\n255\n";
    Assert(bytes.size() == header.size() + static_cast<size_t>(kSize) * kSize * 3, "PPM payload size", failures);
    Assert(std::string(bytes.begin(), bytes.begin() + std::min(bytes.size(), header.size())) == header,
           "PPM header", failures);
    if (bytes.size() > header.size() + 2) {
        // First pixel is the clear color: round(0.1 * 255) = 26.
        Assert(static_cast<unsigned char>(bytes[header.size()]) == 26, "first pixel red channel", failures);
    }
    std::filesystem::remove_all(outputPath.parent_path());
}

} // namespace

int main() {
    int failures = 0;

    try {
        TestInterpolatedColors(failures);
        TestProceduralTriangle(failures);
        TestIdempotentDraws(failures);
        TestBackFacesCulled(failures);
        TestSharedEdgeCoverage(failures);
        TestPrimitiveAssembly(failures);
        TestDepthRange(failures);
        TestFarOffscreenVertex(failures);
        TestNonFinitePositions(failures);
        TestViewportMapping(failures);
        TestErrors(failures);
        TestPpmOutput(failures);
    } catch (const std::exception& ex) {
        std::cerr << "exception during tests: " << ex.what() << '\n';
        return 1;
    }

    if (failures == 0) {
        std::cout << "reference_rasterizer_tests: PASSED\n";
    } else {
        std::cerr << "reference_rasterizer_tests: FAILED (" << failures << " errors)\n";
    }

    return failures;
}
