#include "app/triangle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <cstring>
#include <stdexcept>

namespace tristage::app {

void TriangleApp::LoadSceneData() {
    TRACE_FUNCTION();
    scene_ = sceneScript_.LoadScene(config_.pipelineMode);
    for (const auto& range : scene_.drawRanges) {
        if (range.shaderKey != range.requestedShaderKey) {
            TraceLogger::Log("Unknown shader key '" + range.requestedShaderKey + "', using " + range.shaderKey);
        }
    }
    TRACE_VAR(scene_.defaultShaderKey);
    TRACE_VAR(scene_.vertices.size());
    TRACE_VAR(scene_.drawRanges.size());
}

void TriangleApp::CreateVertexBuffer() {
    TRACE_FUNCTION();
    // The procedural stage synthesizes its own corners.
    if (scene_.vertices.empty()) {
        return;
    }
    VkDeviceSize bufferSize = sizeof(scene_.vertices[0]) * scene_.vertices.size();
    vulkan::CreateBuffer(device_, physicalDevice_, bufferSize, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                         VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, vertexBuffer_,
                         vertexBufferMemory_);

    void* data = nullptr;
    if (vkMapMemory(device_, vertexBufferMemory_, 0, bufferSize, 0, &data) != VK_SUCCESS) {
        throw std::runtime_error("Failed to map vertex buffer memory");
    }
    std::memcpy(data, scene_.vertices.data(), static_cast<size_t>(bufferSize));
    vkUnmapMemory(device_, vertexBufferMemory_);
}

} // namespace tristage::app
