#ifndef TRISTAGE_APP_RUNTIME_CONFIG_HPP
#define TRISTAGE_APP_RUNTIME_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/triangle_stage.hpp"

namespace tristage::app {

constexpr uint32_t kWidth = 1024;
constexpr uint32_t kHeight = 768;

struct RuntimeConfig {
    uint32_t width = kWidth;
    uint32_t height = kHeight;
    std::string windowTitle = "Triangle Stage";
    bool fullscreen = false;
    std::filesystem::path scriptPath;
    core::PipelineMode pipelineMode = core::PipelineMode::VertexBuffer;
};

std::filesystem::path FindScriptPath(const char* argv0);
RuntimeConfig GenerateDefaultRuntimeConfig(const char* argv0);
RuntimeConfig LoadRuntimeConfigFromJson(const std::filesystem::path& configPath, bool dumpConfig);
void WriteRuntimeConfigJson(const RuntimeConfig& runtimeConfig, const std::filesystem::path& configPath);

std::optional<std::filesystem::path> GetUserConfigDirectory();
std::optional<std::filesystem::path> GetDefaultConfigPath();

} // namespace tristage::app

#endif // TRISTAGE_APP_RUNTIME_CONFIG_HPP
