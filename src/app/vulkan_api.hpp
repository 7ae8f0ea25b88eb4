#ifndef TRISTAGE_APP_VULKAN_API_HPP
#define TRISTAGE_APP_VULKAN_API_HPP

#include <string>
#include <vector>

#include <SDL3/SDL.h>
#include <vulkan/vulkan.h>

#include "core/vertex_layout.hpp"

namespace tristage::app::vulkan {

inline const std::vector<const char*> kDeviceExtensions = {
    VK_KHR_SWAPCHAIN_EXTENSION_NAME,
};

// Negative viewport heights (clip-space y up) are core from Vulkan 1.1.
constexpr uint32_t kMinimumDeviceApiVersion = VK_API_VERSION_1_1;

// What device selection knows about one physical device and the window surface.
struct DeviceCapabilities {
    std::string name;
    uint32_t apiVersion = 0;
    VkPhysicalDeviceType type = VK_PHYSICAL_DEVICE_TYPE_OTHER;
    bool hasGraphicsQueue = false;
    bool hasPresentQueue = false;
    std::vector<std::string> extensions;
    std::vector<VkSurfaceFormatKHR> surfaceFormats;
    std::vector<VkPresentModeKHR> presentModes;
};

// Empty when the device can run the triangle pipeline on the surface,
// otherwise the first requirement it misses.
std::string FindDeviceShortfall(const DeviceCapabilities& capabilities);

// Higher is better; discrete GPUs first, CPU implementations last.
int RateDevice(const DeviceCapabilities& capabilities);

std::string FormatApiVersion(uint32_t apiVersion);

// UNORM targets store fragment outputs unchanged, so presented pixels match
// ReferenceRasterizer::ToRgba8. Falls back to the first reported format.
VkSurfaceFormatKHR ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& availableFormats);

// MAILBOX when offered, otherwise FIFO, which every surface supports.
VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& availablePresentModes);

struct VertexInputDescription {
    VkVertexInputBindingDescription binding{};
    std::vector<VkVertexInputAttributeDescription> attributes;
};

VkExtent2D ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, SDL_Window* window);

uint32_t FindMemoryType(VkPhysicalDevice physicalDevice, uint32_t typeFilter, VkMemoryPropertyFlags properties);

void CreateBuffer(VkDevice device, VkPhysicalDevice physicalDevice, VkDeviceSize size, VkBufferUsageFlags usage,
                  VkMemoryPropertyFlags properties, VkBuffer& buffer, VkDeviceMemory& bufferMemory);

VkFormat ToVkFormat(core::VertexFormat format);

// Validates the layout first; a mismatch throws before any pipeline is built.
VertexInputDescription BuildVertexInputDescription(const core::VertexBufferLayout& layout);

} // namespace tristage::app::vulkan

#endif // TRISTAGE_APP_VULKAN_API_HPP
