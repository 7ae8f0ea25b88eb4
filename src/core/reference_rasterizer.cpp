#include "core/reference_rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tristage::core {

namespace {

float EdgeFunction(const glm::vec2& from, const glm::vec2& to, const glm::vec2& point) {
    return (to.x - from.x) * (point.y - from.y) - (to.y - from.y) * (point.x - from.x);
}

// Winding is clockwise on screen (y down) once front faces are normalized,
// so top edges run left to right and left edges run upwards.
bool IsTopLeftEdge(const glm::vec2& from, const glm::vec2& to) {
    glm::vec2 edge = to - from;
    return (edge.y == 0.0f && edge.x > 0.0f) || edge.y < 0.0f;
}

bool IsFinite(const glm::vec2& point) {
    return std::isfinite(point.x) && std::isfinite(point.y);
}

bool Covers(float weight, bool topLeft) {
    return weight > 0.0f || (weight == 0.0f && topLeft);
}

uint8_t QuantizeChannel(float value) {
    float clamped = std::clamp(value, 0.0f, 1.0f);
    return static_cast<uint8_t>(clamped * 255.0f + 0.5f);
}

} // namespace

ReferenceRasterizer::ReferenceRasterizer(uint32_t width, uint32_t height)
    : width_(width),
      height_(height),
      pixels_(static_cast<size_t>(width) * height, FragmentColor(0.0f, 0.0f, 0.0f, 1.0f)) {
    if (width == 0 || height == 0) {
        throw std::runtime_error("Reference framebuffer must have a non-zero extent");
    }
}

void ReferenceRasterizer::Clear(const FragmentColor& color) {
    std::fill(pixels_.begin(), pixels_.end(), color);
}

size_t ReferenceRasterizer::Draw(PipelineMode mode, const std::vector<Vertex>& vertices) {
    std::vector<VertexOutput> outputs;
    FragmentShader shade;

    if (mode == PipelineMode::Procedural) {
        outputs.reserve(kProceduralVertexCount);
        for (uint32_t index = 0; index < kProceduralVertexCount; ++index) {
            outputs.push_back(VertexOutput{ProceduralClipPosition(index), glm::vec3(0.0f)});
        }
        shade = [](const glm::vec3&) { return kProceduralColor; };
    } else {
        outputs.reserve(vertices.size());
        for (const auto& vertex : vertices) {
            outputs.push_back(TransformVertex(vertex));
        }
        shade = [](const glm::vec3& color) { return ColorizeFragment(color); };
    }

    size_t fragments = 0;
    // A trailing incomplete primitive is dropped, as the input assembler does.
    for (size_t i = 0; i + 2 < outputs.size(); i += 3) {
        fragments += RasterizeTriangle(outputs[i], outputs[i + 1], outputs[i + 2], shade);
    }
    return fragments;
}

glm::vec2 ReferenceRasterizer::ClipToFramebuffer(const glm::vec4& clipPosition) const {
    float ndcX = clipPosition.x / clipPosition.w;
    float ndcY = clipPosition.y / clipPosition.w;
    return glm::vec2((ndcX + 1.0f) * 0.5f * static_cast<float>(width_),
                     (1.0f - ndcY) * 0.5f * static_cast<float>(height_));
}

const FragmentColor& ReferenceRasterizer::PixelAt(uint32_t x, uint32_t y) const {
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside the framebuffer");
    }
    return pixels_[static_cast<size_t>(y) * width_ + x];
}

size_t ReferenceRasterizer::RasterizeTriangle(const VertexOutput& a, const VertexOutput& b,
                                              const VertexOutput& c, const FragmentShader& shade) {
    // TODO: clip against w <= 0 instead of dropping the whole primitive.
    if (a.clipPosition.w <= 0.0f || b.clipPosition.w <= 0.0f || c.clipPosition.w <= 0.0f) {
        return 0;
    }

    const VertexOutput* v0 = &a;
    const VertexOutput* v1 = &b;
    const VertexOutput* v2 = &c;
    glm::vec2 p0 = ClipToFramebuffer(v0->clipPosition);
    glm::vec2 p1 = ClipToFramebuffer(v1->clipPosition);
    glm::vec2 p2 = ClipToFramebuffer(v2->clipPosition);
    if (!IsFinite(p0) || !IsFinite(p1) || !IsFinite(p2)) {
        return 0;
    }

    // Counter-clockwise in clip space is negative area once y points down.
    float area = EdgeFunction(p0, p1, p2);
    if (!std::isfinite(area) || area >= 0.0f) {
        return 0;
    }
    std::swap(v1, v2);
    std::swap(p1, p2);
    area = -area;

    bool topLeft0 = IsTopLeftEdge(p1, p2);
    bool topLeft1 = IsTopLeftEdge(p2, p0);
    bool topLeft2 = IsTopLeftEdge(p0, p1);

    // Clamp in float space; vertices may sit far outside the viewport.
    float fbWidth = static_cast<float>(width_);
    float fbHeight = static_cast<float>(height_);
    float minX = std::clamp(std::min({p0.x, p1.x, p2.x}), 0.0f, fbWidth);
    float maxX = std::clamp(std::max({p0.x, p1.x, p2.x}), 0.0f, fbWidth);
    float minY = std::clamp(std::min({p0.y, p1.y, p2.y}), 0.0f, fbHeight);
    float maxY = std::clamp(std::max({p0.y, p1.y, p2.y}), 0.0f, fbHeight);

    int32_t startX = static_cast<int32_t>(std::floor(minX));
    int32_t endX = std::min(static_cast<int32_t>(width_) - 1, static_cast<int32_t>(std::ceil(maxX)));
    int32_t startY = static_cast<int32_t>(std::floor(minY));
    int32_t endY = std::min(static_cast<int32_t>(height_) - 1, static_cast<int32_t>(std::ceil(maxY)));

    float invW0 = 1.0f / v0->clipPosition.w;
    float invW1 = 1.0f / v1->clipPosition.w;
    float invW2 = 1.0f / v2->clipPosition.w;
    float z0 = v0->clipPosition.z * invW0;
    float z1 = v1->clipPosition.z * invW1;
    float z2 = v2->clipPosition.z * invW2;

    size_t written = 0;
    for (int32_t y = startY; y <= endY; ++y) {
        for (int32_t x = startX; x <= endX; ++x) {
            glm::vec2 sample(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);
            float w0 = EdgeFunction(p1, p2, sample);
            float w1 = EdgeFunction(p2, p0, sample);
            float w2 = EdgeFunction(p0, p1, sample);
            if (!Covers(w0, topLeft0) || !Covers(w1, topLeft1) || !Covers(w2, topLeft2)) {
                continue;
            }

            float b0 = w0 / area;
            float b1 = w1 / area;
            float b2 = w2 / area;

            // Outside the [0, 1] depth range the GPU clips the fragment away.
            float depth = b0 * z0 + b1 * z1 + b2 * z2;
            if (depth < 0.0f || depth > 1.0f) {
                continue;
            }

            float c0 = b0 * invW0;
            float c1 = b1 * invW1;
            float c2 = b2 * invW2;
            float norm = c0 + c1 + c2;
            glm::vec3 color = (v0->color * c0 + v1->color * c1 + v2->color * c2) / norm;

            pixels_[static_cast<size_t>(y) * width_ + static_cast<size_t>(x)] = shade(color);
            ++written;
        }
    }
    return written;
}

std::vector<uint8_t> ReferenceRasterizer::ToRgba8() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(pixels_.size() * 4);
    for (const auto& pixel : pixels_) {
        bytes.push_back(QuantizeChannel(pixel.r));
        bytes.push_back(QuantizeChannel(pixel.g));
        bytes.push_back(QuantizeChannel(pixel.b));
        bytes.push_back(QuantizeChannel(pixel.a));
    }
    return bytes;
}

void ReferenceRasterizer::WritePpm(const std::filesystem::path& path) const {
    auto parentDir = path.parent_path();
    if (!parentDir.empty()) {
        std::filesystem::create_directories(parentDir);
    }

    std::ofstream outFile(path, std::ios::binary);
    if (!outFile) {
        throw std::runtime_error("Failed to open snapshot output file: " + path.string());
    }
    outFile << "P6\n" << width_ << ' ' << height_ << "\n255\n";
    std::vector<uint8_t> rgba = ToRgba8();
    for (size_t i = 0; i < rgba.size(); i += 4) {
        outFile.put(static_cast<char>(rgba[i]));
        outFile.put(static_cast<char>(rgba[i + 1]));
        outFile.put(static_cast<char>(rgba[i + 2]));
    }
    if (!outFile) {
        throw std::runtime_error("Failed to write snapshot: " + path.string());
    }
}

} // namespace tristage::core
