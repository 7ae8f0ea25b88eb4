#include "app/triangle_app.hpp"
#include "app/trace.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tristage::app {

std::vector<char> ReadFile(const std::filesystem::path& path) {
    TRACE_FUNCTION();
    TRACE_VAR(path);
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file) {
        throw std::runtime_error("failed to open file: " + path.string());
    }
    size_t size = static_cast<size_t>(file.tellg());
    std::vector<char> buffer(size);
    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (!file) {
        throw std::runtime_error("failed to read file: " + path.string());
    }
    return buffer;
}

namespace {

std::string BuildSdlErrorMessage(const char* context) {
    std::ostringstream oss;
    oss << context;
    const char* sdlError = SDL_GetError();
    if (sdlError && *sdlError != '\0') {
        oss << ": " << sdlError;
    } else {
        oss << ": (SDL_GetError returned an empty string)";
    }
    return oss.str();
}

void ThrowSdlErrorIfFailed(bool success, const char* context) {
    if (!success) {
        throw std::runtime_error(BuildSdlErrorMessage(context));
    }
}

} // namespace

TriangleApp::TriangleApp(const RuntimeConfig& config, bool luaDebug)
    : config_(config),
      sceneScript_(config.scriptPath, luaDebug) {
    TRACE_FUNCTION();
    TRACE_VAR(config.scriptPath);
}

TriangleApp::~TriangleApp() {
    Cleanup();
}

void TriangleApp::Run() {
    TRACE_FUNCTION();
    try {
        InitSDL();
        InitVulkan();
        MainLoop();
    } catch (...) {
        Cleanup();
        throw;
    }
    Cleanup();
}

void TriangleApp::InitSDL() {
    TRACE_FUNCTION();
    TRACE_VAR(config_.width);
    TRACE_VAR(config_.height);
    ThrowSdlErrorIfFailed(SDL_Init(SDL_INIT_VIDEO), "SDL_Init failed");
    sdlInitialized_ = true;
    ThrowSdlErrorIfFailed(SDL_Vulkan_LoadLibrary(nullptr), "SDL_Vulkan_LoadLibrary failed");

    SDL_WindowFlags flags = SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    if (config_.fullscreen) {
        flags |= SDL_WINDOW_FULLSCREEN;
    }
    window_ = SDL_CreateWindow(config_.windowTitle.c_str(), static_cast<int>(config_.width),
                               static_cast<int>(config_.height), flags);
    if (!window_) {
        throw std::runtime_error(BuildSdlErrorMessage("SDL_CreateWindow failed"));
    }
    TRACE_VAR(window_);
}

void TriangleApp::InitVulkan() {
    TRACE_FUNCTION();
    CreateInstance();
    CreateSurface();
    PickPhysicalDevice();
    CreateLogicalDevice();
    CreateSwapChain();
    CreateImageViews();
    CreateRenderPass();
    LoadSceneData();
    CreateGraphicsPipeline();
    CreateFramebuffers();
    CreateCommandPool();
    CreateVertexBuffer();
    CreateCommandBuffers();
    CreateSyncObjects();
}

void TriangleApp::MainLoop() {
    TRACE_FUNCTION();
    bool running = true;
    uint64_t frameCount = 0;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
                case SDL_EVENT_QUIT:
                    TraceLogger::Log("Exiting after " + std::to_string(SDL_GetTicks()) + " ms");
                    running = false;
                    break;
                case SDL_EVENT_KEY_DOWN:
                    if (event.key.key == SDLK_ESCAPE) {
                        TraceLogger::Log("Exiting from escape key after " + std::to_string(SDL_GetTicks()) + " ms");
                        running = false;
                    }
                    break;
                case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                case SDL_EVENT_DID_ENTER_FOREGROUND:
                    framebufferResized_ = true;
                    break;
                default:
                    break;
            }
        }
        if (!running) {
            break;
        }

        DrawFrame();
        ++frameCount;
    }
    TRACE_VAR(frameCount);

    vkDeviceWaitIdle(device_);
}

void TriangleApp::Cleanup() {
    TRACE_FUNCTION();
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);
        CleanupSwapChain();

        vkDestroyBuffer(device_, vertexBuffer_, nullptr);
        vkFreeMemory(device_, vertexBufferMemory_, nullptr);
        vertexBuffer_ = VK_NULL_HANDLE;
        vertexBufferMemory_ = VK_NULL_HANDLE;
        vkDestroySemaphore(device_, renderFinishedSemaphore_, nullptr);
        vkDestroySemaphore(device_, imageAvailableSemaphore_, nullptr);
        vkDestroyFence(device_, inFlightFence_, nullptr);
        renderFinishedSemaphore_ = VK_NULL_HANDLE;
        imageAvailableSemaphore_ = VK_NULL_HANDLE;
        inFlightFence_ = VK_NULL_HANDLE;
        vkDestroyCommandPool(device_, commandPool_, nullptr);
        commandPool_ = VK_NULL_HANDLE;

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    if (sdlInitialized_) {
        SDL_Vulkan_UnloadLibrary();
        SDL_Quit();
        sdlInitialized_ = false;
    }
}

} // namespace tristage::app
