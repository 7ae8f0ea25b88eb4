#include "app/runtime_config.hpp"

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

namespace fs = std::filesystem;

void Assert(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "test failure: " << message << '\n';
        ++failures;
    }
}

void WriteText(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to write test file: " + path.string());
    }
    out << text;
}

void ExpectRejected(const fs::path& configPath, const std::string& json, const std::string& label, int& failures) {
    WriteText(configPath, json);
    try {
        tristage::app::LoadRuntimeConfigFromJson(configPath, false);
        std::cerr << "test failure: " << label << " was accepted\n";
        ++failures;
    } catch (const std::runtime_error& ex) {
        std::cout << label << " rejected: " << ex.what() << '\n';
    }
}

void TestSeedRoundTrip(const fs::path& root, const fs::path& scriptPath, int& failures) {
    tristage::app::RuntimeConfig config;
    config.width = 640;
    config.height = 480;
    config.windowTitle = "Round Trip";
    config.fullscreen = true;
    config.scriptPath = scriptPath;
    config.pipelineMode = tristage::core::PipelineMode::Procedural;

    auto seedPath = root / "seed" / "runtime.json";
    tristage::app::WriteRuntimeConfigJson(config, seedPath);
    auto loaded = tristage::app::LoadRuntimeConfigFromJson(seedPath, false);

    Assert(loaded.width == 640 && loaded.height == 480, "dimensions survive the round trip", failures);
    Assert(loaded.windowTitle == "Round Trip", "window title survives the round trip", failures);
    Assert(loaded.fullscreen, "fullscreen survives the round trip", failures);
    Assert(loaded.pipelineMode == tristage::core::PipelineMode::Procedural, "pipeline mode survives", failures);
    Assert(loaded.scriptPath == fs::weakly_canonical(scriptPath), "script path survives the round trip", failures);

    std::ifstream seedStream(seedPath);
    rapidjson::IStreamWrapper wrapper(seedStream);
    rapidjson::Document document;
    document.ParseStream(wrapper);
    Assert(!document.HasParseError() && document.IsObject(), "seed output is a JSON object", failures);
    if (document.IsObject()) {
        bool hasSwapchain = false;
        if (document.HasMember("device_extensions") && document["device_extensions"].IsArray()) {
            for (const auto& extension : document["device_extensions"].GetArray()) {
                if (extension.IsString() && std::string(extension.GetString()) == "VK_KHR_swapchain") {
                    hasSwapchain = true;
                }
            }
        }
        Assert(hasSwapchain, "seed lists the swapchain device extension", failures);
        Assert(document.HasMember("config_file") && document["config_file"].IsString() &&
                   fs::path(document["config_file"].GetString()) == seedPath,
               "seed records its own path", failures);
        Assert(document.HasMember("shaders_directory") && document.HasMember("scripts_directory"),
               "seed records the project directories", failures);
    }
}

void TestRelativePaths(const fs::path& root, const fs::path& scriptPath, int& failures) {
    auto configPath = root / "configs" / "relative.json";
    WriteText(configPath, R"({"project_root": "..", "lua_script": "scripts/scene.lua"})");
    auto loaded = tristage::app::LoadRuntimeConfigFromJson(configPath, false);
    Assert(loaded.scriptPath == fs::weakly_canonical(scriptPath), "lua_script resolves against project_root",
           failures);
    Assert(loaded.width == tristage::app::kWidth && loaded.height == tristage::app::kHeight,
           "missing dimensions keep the defaults", failures);
    Assert(loaded.pipelineMode == tristage::core::PipelineMode::VertexBuffer,
           "vertex buffer mode is the default", failures);
    Assert(!loaded.fullscreen, "windowed is the default", failures);

    auto siblingPath = root / "scripts" / "sibling.json";
    WriteText(siblingPath, R"({"lua_script": "scene.lua", "window_width": 320})");
    auto sibling = tristage::app::LoadRuntimeConfigFromJson(siblingPath, false);
    Assert(sibling.scriptPath == fs::weakly_canonical(scriptPath),
           "without project_root, lua_script resolves against the config directory", failures);
    Assert(sibling.width == 320, "window_width is read", failures);
}

void TestRejectedConfigs(const fs::path& root, const fs::path& scriptPath, int& failures) {
    auto configPath = root / "rejected.json";
    const std::string script = "\"lua_script\": \"" + scriptPath.generic_string() + "\"";
    ExpectRejected(configPath, R"({"window_width": 800})", "missing lua_script", failures);
    ExpectRejected(configPath, "{" + script + ", \"window_width\": -5}", "negative width", failures);
    ExpectRejected(configPath, "{" + script + ", \"window_height\": \"tall\"}", "string height", failures);
    ExpectRejected(configPath, "{" + script + ", \"window_width\": 0}", "zero width", failures);
    ExpectRejected(configPath, "{" + script + ", \"window_height\": 0}", "zero height", failures);
    ExpectRejected(configPath, "{" + script + ", \"window_width\": 640.5}", "fractional width", failures);
    ExpectRejected(configPath, "{" + script + ", \"pipeline_mode\": \"wireframe\"}", "unknown pipeline mode",
                   failures);
    ExpectRejected(configPath, "{" + script + ", \"fullscreen\": \"yes\"}", "non-boolean fullscreen", failures);
    ExpectRejected(configPath, R"({"lua_script": "missing/nowhere.lua"})", "missing script file", failures);
    ExpectRejected(configPath, "[1, 2, 3]", "non-object root", failures);
    ExpectRejected(configPath, "{ not json", "parse error", failures);

    bool threw = false;
    try {
        tristage::app::LoadRuntimeConfigFromJson(root / "absent.json", false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Assert(threw, "absent config file should throw", failures);
}

void TestDefaultLocations(const fs::path& root, int& failures) {
#ifndef _WIN32
    auto xdg = root / "xdg";
    setenv("XDG_CONFIG_HOME", xdg.string().c_str(), 1);
    auto dir = tristage::app::GetUserConfigDirectory();
    Assert(dir && *dir == xdg / "tristage", "XDG_CONFIG_HOME decides the config directory", failures);
    auto path = tristage::app::GetDefaultConfigPath();
    Assert(path && *path == xdg / "tristage" / "default_runtime.json", "default runtime json location", failures);
#else
    (void)root;
    (void)failures;
#endif
}

} // namespace

int main() {
    int failures = 0;
    auto root = fs::temp_directory_path() / "tristage_runtime_config_test";

    try {
        fs::remove_all(root);
        auto scriptPath = root / "scripts" / "scene.lua";
        WriteText(scriptPath, "-- placeholder scene\n");

        TestSeedRoundTrip(root, scriptPath, failures);
        TestRelativePaths(root, scriptPath, failures);
        TestRejectedConfigs(root, scriptPath, failures);
        TestDefaultLocations(root, failures);
        fs::remove_all(root);
    } catch (const std::exception& ex) {
        std::cerr << "exception during tests: " << ex.what() << '\n';
        return 1;
    }

    if (failures == 0) {
        std::cout << "runtime_config_tests: PASSED\n";
    } else {
        std::cerr << "runtime_config_tests: FAILED (" << failures << " errors)\n";
    }

    return failures;
}
