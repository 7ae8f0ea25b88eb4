#include "app/vulkan_api.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tristage::app::vulkan {

std::string FormatApiVersion(uint32_t apiVersion) {
    return std::to_string(VK_API_VERSION_MAJOR(apiVersion)) + "." + std::to_string(VK_API_VERSION_MINOR(apiVersion)) +
           "." + std::to_string(VK_API_VERSION_PATCH(apiVersion));
}

std::string FindDeviceShortfall(const DeviceCapabilities& capabilities) {
    if (capabilities.apiVersion < kMinimumDeviceApiVersion) {
        return "Vulkan " + FormatApiVersion(kMinimumDeviceApiVersion) + " is required for the flipped viewport, "
               "device reports " + FormatApiVersion(capabilities.apiVersion);
    }
    if (!capabilities.hasGraphicsQueue) {
        return "no graphics queue family";
    }
    if (!capabilities.hasPresentQueue) {
        return "no queue family can present to the window surface";
    }
    for (const char* required : kDeviceExtensions) {
        if (std::find(capabilities.extensions.begin(), capabilities.extensions.end(), required) ==
            capabilities.extensions.end()) {
            return std::string("missing device extension ") + required;
        }
    }
    if (capabilities.surfaceFormats.empty()) {
        return "surface reports no formats";
    }
    if (std::find(capabilities.presentModes.begin(), capabilities.presentModes.end(), VK_PRESENT_MODE_FIFO_KHR) ==
        capabilities.presentModes.end()) {
        return "surface does not offer FIFO presentation";
    }
    return {};
}

int RateDevice(const DeviceCapabilities& capabilities) {
    switch (capabilities.type) {
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return 4;
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return 3;
        case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return 2;
        case VK_PHYSICAL_DEVICE_TYPE_CPU: return 1;
        default: return 0;
    }
}

VkSurfaceFormatKHR ChooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& availableFormats) {
    if (availableFormats.empty()) {
        throw std::runtime_error("Surface reports no formats");
    }
    for (VkFormat preferred : {VK_FORMAT_B8G8R8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM}) {
        for (const auto& available : availableFormats) {
            if (available.format == preferred && available.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
                return available;
            }
        }
    }
    return availableFormats[0];
}

VkPresentModeKHR ChoosePresentMode(const std::vector<VkPresentModeKHR>& availablePresentModes) {
    for (const auto& presentMode : availablePresentModes) {
        if (presentMode == VK_PRESENT_MODE_MAILBOX_KHR) {
            return presentMode;
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

uint32_t FindMemoryType(VkPhysicalDevice physicalDevice, uint32_t typeFilter, VkMemoryPropertyFlags properties) {
    VkPhysicalDeviceMemoryProperties memProperties;
    vkGetPhysicalDeviceMemoryProperties(physicalDevice, &memProperties);

    for (uint32_t i = 0; i < memProperties.memoryTypeCount; ++i) {
        if ((typeFilter & (1u << i)) &&
            (memProperties.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }

    throw std::runtime_error("Failed to find suitable memory type");
}

VkExtent2D ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, SDL_Window* window) {
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return capabilities.currentExtent;
    }

    int width = 0;
    int height = 0;
    SDL_GetWindowSizeInPixels(window, &width, &height);

    return VkExtent2D{
        static_cast<uint32_t>(std::clamp(width, static_cast<int>(capabilities.minImageExtent.width),
                                          static_cast<int>(capabilities.maxImageExtent.width))),
        static_cast<uint32_t>(std::clamp(height, static_cast<int>(capabilities.minImageExtent.height),
                                          static_cast<int>(capabilities.maxImageExtent.height)))
    };
}

void CreateBuffer(VkDevice device, VkPhysicalDevice physicalDevice, VkDeviceSize size, VkBufferUsageFlags usage,
                  VkMemoryPropertyFlags properties, VkBuffer& buffer, VkDeviceMemory& bufferMemory) {
    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateBuffer(device, &bufferInfo, nullptr, &buffer) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create buffer");
    }

    VkMemoryRequirements memRequirements;
    vkGetBufferMemoryRequirements(device, buffer, &memRequirements);

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = memRequirements.size;
    allocInfo.memoryTypeIndex =
        FindMemoryType(physicalDevice, memRequirements.memoryTypeBits, properties);

    if (vkAllocateMemory(device, &allocInfo, nullptr, &bufferMemory) != VK_SUCCESS) {
        vkDestroyBuffer(device, buffer, nullptr);
        buffer = VK_NULL_HANDLE;
        throw std::runtime_error("Failed to allocate buffer memory");
    }

    if (vkBindBufferMemory(device, buffer, bufferMemory, 0) != VK_SUCCESS) {
        throw std::runtime_error("Failed to bind buffer memory");
    }
}

VkFormat ToVkFormat(core::VertexFormat format) {
    switch (format) {
        case core::VertexFormat::Float32x2: return VK_FORMAT_R32G32_SFLOAT;
        case core::VertexFormat::Float32x3: return VK_FORMAT_R32G32B32_SFLOAT;
        case core::VertexFormat::Float32x4: return VK_FORMAT_R32G32B32A32_SFLOAT;
    }
    throw std::runtime_error("Unsupported vertex format");
}

VertexInputDescription BuildVertexInputDescription(const core::VertexBufferLayout& layout) {
    core::ValidateVertexBufferLayout(layout);

    VertexInputDescription description;
    description.binding.binding = 0;
    description.binding.stride = layout.stride;
    description.binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

    description.attributes.reserve(layout.attributes.size());
    for (const auto& attribute : layout.attributes) {
        VkVertexInputAttributeDescription attributeDescription{};
        attributeDescription.binding = 0;
        attributeDescription.location = attribute.location;
        attributeDescription.format = ToVkFormat(attribute.format);
        attributeDescription.offset = attribute.offset;
        description.attributes.push_back(attributeDescription);
    }
    return description;
}

} // namespace tristage::app::vulkan
