#include "app/runtime_config.hpp"

#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tristage::app {

std::filesystem::path FindScriptPath(const char* argv0) {
    TRACE_FUNCTION();
    std::filesystem::path executable;
    if (argv0 && *argv0 != '\0') {
        executable = std::filesystem::path(argv0);
        if (executable.is_relative()) {
            executable = std::filesystem::current_path() / executable;
        }
    } else {
        executable = std::filesystem::current_path();
    }
    executable = std::filesystem::weakly_canonical(executable);
    std::filesystem::path scriptPath = executable.parent_path() / "scripts" / "triangle_scene.lua";
    if (!std::filesystem::exists(scriptPath)) {
        throw std::runtime_error("Could not find Lua script at " + scriptPath.string());
    }
    return scriptPath;
}

RuntimeConfig GenerateDefaultRuntimeConfig(const char* argv0) {
    RuntimeConfig config;
    config.scriptPath = FindScriptPath(argv0);
    return config;
}

RuntimeConfig LoadRuntimeConfigFromJson(const std::filesystem::path& configPath, bool dumpConfig) {
    TRACE_FUNCTION();
    TRACE_VAR(configPath);
    std::ifstream configStream(configPath);
    if (!configStream) {
        throw std::runtime_error("Failed to open config file: " + configPath.string());
    }

    rapidjson::IStreamWrapper inputWrapper(configStream);
    rapidjson::Document document;
    document.ParseStream(inputWrapper);
    if (document.HasParseError()) {
        throw std::runtime_error("Failed to parse JSON config at " + configPath.string());
    }
    if (!document.IsObject()) {
        throw std::runtime_error("JSON config must contain an object at the root");
    }

    if (dumpConfig) {
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        document.Accept(writer);
        std::cout << "Loaded runtime config (" << configPath << "):\n"
                  << buffer.GetString() << '\n';
    }

    const char* scriptField = "lua_script";
    if (!document.HasMember(scriptField) || !document[scriptField].IsString()) {
        throw std::runtime_error("JSON config requires a string member '" + std::string(scriptField) + "'");
    }

    std::optional<std::filesystem::path> projectRoot;
    const char* projectRootField = "project_root";
    if (document.HasMember(projectRootField) && document[projectRootField].IsString()) {
        std::filesystem::path candidate(document[projectRootField].GetString());
        if (candidate.is_absolute()) {
            projectRoot = std::filesystem::weakly_canonical(candidate);
        } else {
            projectRoot = std::filesystem::weakly_canonical(configPath.parent_path() / candidate);
        }
    }

    RuntimeConfig config;
    const auto& scriptValue = document[scriptField];
    std::filesystem::path scriptPath(scriptValue.GetString());
    if (!scriptPath.is_absolute()) {
        if (projectRoot) {
            scriptPath = *projectRoot / scriptPath;
        } else {
            scriptPath = configPath.parent_path() / scriptPath;
        }
    }
    scriptPath = std::filesystem::weakly_canonical(scriptPath);
    if (!std::filesystem::exists(scriptPath)) {
        throw std::runtime_error("Lua script not found at " + scriptPath.string());
    }
    config.scriptPath = scriptPath;

    auto parseDimension = [&](const char* name, uint32_t defaultValue) -> uint32_t {
        if (!document.HasMember(name)) {
            return defaultValue;
        }
        // A zero-sized window has no swapchain extent and a zero-sized snapshot no pixels.
        const auto& value = document[name];
        if (value.IsUint() && value.GetUint() > 0) {
            return value.GetUint();
        }
        throw std::runtime_error(std::string("JSON member '") + name + "' must be a positive integer");
    };

    config.width = parseDimension("window_width", config.width);
    config.height = parseDimension("window_height", config.height);

    if (document.HasMember("window_title")) {
        if (!document["window_title"].IsString()) {
            throw std::runtime_error("JSON member 'window_title' must be a string");
        }
        config.windowTitle = document["window_title"].GetString();
    }

    if (document.HasMember("fullscreen")) {
        if (!document["fullscreen"].IsBool()) {
            throw std::runtime_error("JSON member 'fullscreen' must be a boolean");
        }
        config.fullscreen = document["fullscreen"].GetBool();
    }

    if (document.HasMember("pipeline_mode")) {
        if (!document["pipeline_mode"].IsString()) {
            throw std::runtime_error("JSON member 'pipeline_mode' must be a string");
        }
        config.pipelineMode = core::ParsePipelineMode(document["pipeline_mode"].GetString());
    }

    return config;
}

std::optional<std::filesystem::path> GetUserConfigDirectory() {
#ifdef _WIN32
    if (const char* appData = std::getenv("APPDATA")) {
        return std::filesystem::path(appData) / "tristage";
    }
#else
    if (const char* xdgConfig = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(xdgConfig) / "tristage";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "tristage";
    }
#endif
    return std::nullopt;
}

std::optional<std::filesystem::path> GetDefaultConfigPath() {
    if (auto dir = GetUserConfigDirectory()) {
        return *dir / "default_runtime.json";
    }
    return std::nullopt;
}

void WriteRuntimeConfigJson(const RuntimeConfig& runtimeConfig,
                            const std::filesystem::path& configPath) {
    TRACE_FUNCTION();
    TRACE_VAR(configPath);
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();

    document.AddMember("window_width", runtimeConfig.width, allocator);
    document.AddMember("window_height", runtimeConfig.height, allocator);
    document.AddMember("window_title",
                       rapidjson::Value(runtimeConfig.windowTitle.c_str(), allocator), allocator);
    document.AddMember("fullscreen", runtimeConfig.fullscreen, allocator);
    document.AddMember("pipeline_mode",
                       rapidjson::Value(core::PipelineModeName(runtimeConfig.pipelineMode).c_str(), allocator),
                       allocator);
    document.AddMember("lua_script",
                       rapidjson::Value(runtimeConfig.scriptPath.string().c_str(), allocator),
                       allocator);

    std::filesystem::path scriptsDir = runtimeConfig.scriptPath.parent_path();
    document.AddMember("scripts_directory",
                       rapidjson::Value(scriptsDir.string().c_str(), allocator), allocator);

    std::filesystem::path projectRoot = scriptsDir.parent_path();
    if (!projectRoot.empty()) {
        document.AddMember(
            "project_root",
            rapidjson::Value(projectRoot.string().c_str(), allocator), allocator);
        document.AddMember(
            "shaders_directory",
            rapidjson::Value((projectRoot / "shaders").string().c_str(), allocator), allocator);
    } else {
        document.AddMember("shaders_directory",
                           rapidjson::Value("shaders", allocator), allocator);
    }

    rapidjson::Value extensionArray(rapidjson::kArrayType);
    for (const char* extension : vulkan::kDeviceExtensions) {
        extensionArray.PushBack(rapidjson::Value(extension, allocator), allocator);
    }
    document.AddMember("device_extensions", extensionArray, allocator);
    document.AddMember("config_file",
                       rapidjson::Value(configPath.string().c_str(), allocator), allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    document.Accept(writer);

    auto parentDir = configPath.parent_path();
    if (!parentDir.empty()) {
        std::filesystem::create_directories(parentDir);
    }

    std::ofstream outFile(configPath);
    if (!outFile) {
        throw std::runtime_error("Failed to open config output file: " + configPath.string());
    }
    outFile << buffer.GetString();
}

} // namespace tristage::app
