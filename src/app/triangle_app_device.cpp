#include "app/triangle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tristage::app {

void TriangleApp::CreateInstance() {
    TRACE_FUNCTION();
    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = config_.windowTitle.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.pEngineName = "tristage";
    appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.apiVersion = VK_API_VERSION_1_2;

    Uint32 extensionCount = 0;
    const char* const* extensions = SDL_Vulkan_GetInstanceExtensions(&extensionCount);
    if (!extensions) {
        throw std::runtime_error(std::string("Failed to query Vulkan instance extensions: ") + SDL_GetError());
    }

    std::vector<const char*> extensionList(extensions, extensions + extensionCount);
    for (const char* extension : extensionList) {
        TraceLogger::Log(std::string("Instance extension: ") + extension);
    }

    VkInstanceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(extensionList.size());
    createInfo.ppEnabledExtensionNames = extensionList.data();

    VkResult result = vkCreateInstance(&createInfo, nullptr, &instance_);
    if (result == VK_ERROR_INCOMPATIBLE_DRIVER) {
        throw std::runtime_error("No Vulkan driver supports API " + vulkan::FormatApiVersion(appInfo.apiVersion));
    }
    if (result != VK_SUCCESS) {
        throw std::runtime_error("Failed to create Vulkan instance");
    }
}

void TriangleApp::CreateSurface() {
    TRACE_FUNCTION();
    if (!SDL_Vulkan_CreateSurface(window_, instance_, nullptr, &surface_)) {
        throw std::runtime_error(std::string("Failed to create Vulkan surface: ") + SDL_GetError());
    }
}

void TriangleApp::PickPhysicalDevice() {
    TRACE_FUNCTION();
    uint32_t deviceCount = 0;
    vkEnumeratePhysicalDevices(instance_, &deviceCount, nullptr);
    if (deviceCount == 0) {
        throw std::runtime_error("Failed to find GPUs with Vulkan support");
    }
    std::vector<VkPhysicalDevice> devices(deviceCount);
    vkEnumeratePhysicalDevices(instance_, &deviceCount, devices.data());

    int bestRating = -1;
    std::string bestName;
    std::string rejections;
    for (VkPhysicalDevice device : devices) {
        vulkan::DeviceCapabilities capabilities = QueryDeviceCapabilities(device);
        std::string shortfall = vulkan::FindDeviceShortfall(capabilities);
        if (!shortfall.empty()) {
            TraceLogger::Log("Skipping GPU " + capabilities.name + ": " + shortfall);
            rejections += "\n  " + capabilities.name + ": " + shortfall;
            continue;
        }
        int rating = vulkan::RateDevice(capabilities);
        TraceLogger::Log("Candidate GPU " + capabilities.name + " (Vulkan " +
                         vulkan::FormatApiVersion(capabilities.apiVersion) + ", rating " + std::to_string(rating) +
                         ")");
        if (rating > bestRating) {
            bestRating = rating;
            bestName = capabilities.name;
            physicalDevice_ = device;
        }
    }

    if (physicalDevice_ == VK_NULL_HANDLE) {
        throw std::runtime_error("Failed to find a suitable GPU:" + rejections);
    }
    TraceLogger::Log("Selected GPU: " + bestName);
}

void TriangleApp::CreateLogicalDevice() {
    TRACE_FUNCTION();
    QueueFamilyIndices indices = FindQueueFamilies(physicalDevice_);

    std::vector<VkDeviceQueueCreateInfo> queueCreateInfos;
    std::set<uint32_t> uniqueQueueFamilies = {*indices.graphicsFamily, *indices.presentFamily};
    TRACE_VAR(*indices.graphicsFamily);
    TRACE_VAR(*indices.presentFamily);

    float queuePriority = 1.0f;
    for (uint32_t queueFamily : uniqueQueueFamilies) {
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = queueFamily;
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;
        queueCreateInfos.push_back(queueCreateInfo);
    }

    // Fill mode, line width and sample count stay at their core defaults.
    VkPhysicalDeviceFeatures deviceFeatures{};

    VkDeviceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size());
    createInfo.pQueueCreateInfos = queueCreateInfos.data();
    createInfo.pEnabledFeatures = &deviceFeatures;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(vulkan::kDeviceExtensions.size());
    createInfo.ppEnabledExtensionNames = vulkan::kDeviceExtensions.data();

    if (vkCreateDevice(physicalDevice_, &createInfo, nullptr, &device_) != VK_SUCCESS) {
        throw std::runtime_error("Failed to create logical device");
    }

    vkGetDeviceQueue(device_, *indices.graphicsFamily, 0, &graphicsQueue_);
    vkGetDeviceQueue(device_, *indices.presentFamily, 0, &presentQueue_);
}

QueueFamilyIndices TriangleApp::FindQueueFamilies(VkPhysicalDevice device) {
    QueueFamilyIndices indices;

    uint32_t queueFamilyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);
    std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

    // A family that both draws and presents keeps the swapchain images exclusive.
    for (uint32_t i = 0; i < queueFamilyCount; ++i) {
        bool graphics = (queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
        VkBool32 presentSupport = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface_, &presentSupport);

        if (graphics && presentSupport) {
            indices.graphicsFamily = i;
            indices.presentFamily = i;
            return indices;
        }
        if (graphics && !indices.graphicsFamily) {
            indices.graphicsFamily = i;
        }
        if (presentSupport && !indices.presentFamily) {
            indices.presentFamily = i;
        }
    }
    return indices;
}

SwapChainSupportDetails TriangleApp::QuerySwapChainSupport(VkPhysicalDevice device) {
    SwapChainSupportDetails details;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface_, &details.capabilities);

    uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface_, &formatCount, nullptr);
    details.formats.resize(formatCount);
    if (formatCount != 0) {
        vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface_, &formatCount, details.formats.data());
    }

    uint32_t presentModeCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface_, &presentModeCount, nullptr);
    details.presentModes.resize(presentModeCount);
    if (presentModeCount != 0) {
        vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface_, &presentModeCount,
                                                  details.presentModes.data());
    }

    return details;
}

vulkan::DeviceCapabilities TriangleApp::QueryDeviceCapabilities(VkPhysicalDevice device) {
    vulkan::DeviceCapabilities capabilities;

    VkPhysicalDeviceProperties properties;
    vkGetPhysicalDeviceProperties(device, &properties);
    capabilities.name = properties.deviceName;
    capabilities.apiVersion = properties.apiVersion;
    capabilities.type = properties.deviceType;

    QueueFamilyIndices indices = FindQueueFamilies(device);
    capabilities.hasGraphicsQueue = indices.graphicsFamily.has_value();
    capabilities.hasPresentQueue = indices.presentFamily.has_value();

    uint32_t extensionCount = 0;
    vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, nullptr);
    std::vector<VkExtensionProperties> availableExtensions(extensionCount);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, availableExtensions.data());
    for (const auto& extension : availableExtensions) {
        capabilities.extensions.emplace_back(extension.extensionName);
    }

    // Surface queries are only meaningful once the swapchain extension exists.
    bool hasSwapchain = std::find(capabilities.extensions.begin(), capabilities.extensions.end(),
                                  VK_KHR_SWAPCHAIN_EXTENSION_NAME) != capabilities.extensions.end();
    if (hasSwapchain) {
        SwapChainSupportDetails support = QuerySwapChainSupport(device);
        capabilities.surfaceFormats = std::move(support.formats);
        capabilities.presentModes = std::move(support.presentModes);
    }
    return capabilities;
}

} // namespace tristage::app
