#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "app/runtime_config.hpp"
#include "app/trace.hpp"
#include "app/triangle_app.hpp"
#include "core/reference_rasterizer.hpp"
#include "script/scene_script.hpp"

namespace {

using tristage::app::RuntimeConfig;
using tristage::app::TraceLogger;

struct AppOptions {
    RuntimeConfig runtimeConfig;
    std::optional<std::filesystem::path> seedOutput;
    std::optional<std::filesystem::path> snapshotOutput;
    bool saveDefaultJson = false;
    bool dumpRuntimeJson = false;
    bool traceEnabled = false;
    bool luaDebug = false;
};

AppOptions ParseCommandLine(int argc, char** argv) {
    std::string jsonInputText;
    std::string seedOutputText;
    std::string setDefaultJsonPath;
    std::string snapshotText;
    bool dumpRuntimeJson = false;
    bool traceRuntime = false;
    bool forceProcedural = false;
    bool luaDebug = false;

    CLI::App app("Triangle stage: SDL3 + Vulkan pass-through color pipeline");
    app.add_option("-j,--json-file-in", jsonInputText, "Path to a runtime JSON config")
        ->check(CLI::ExistingFile);
    app.add_option("-s,--create-seed-json", seedOutputText,
                   "Write a template runtime JSON file");
    auto* setDefaultJsonOption = app.add_option(
        "-d,--set-default-json", setDefaultJsonPath,
        "Persist the runtime JSON to the platform default location (XDG/APPDATA); "
        "provide PATH to copy that JSON instead of using the default contents");
    setDefaultJsonOption->type_name("PATH");
    setDefaultJsonOption->type_size(1, 1);
    setDefaultJsonOption->expected(0, 1);
    app.add_flag("--dump-json", dumpRuntimeJson, "Print the runtime JSON that was loaded");
    app.add_flag("--trace", traceRuntime, "Emit a log line when key functions/methods run");
    app.add_flag("--procedural", forceProcedural,
                 "Draw the procedural triangle instead of the scene vertex buffer");
    app.add_option("--snapshot", snapshotText,
                   "Render one frame on the CPU to a PPM file and exit without opening a window")
        ->type_name("PATH");
    app.add_flag("--lua-debug", luaDebug, "Set the lua_debug global for the scene script");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        std::exit(app.exit(e));
    } catch (const CLI::CallForVersion& e) {
        std::exit(app.exit(e));
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        throw;
    }

    // Set before any config loading so those steps trace too.
    TraceLogger::SetEnabled(traceRuntime);

    bool shouldSaveDefault = setDefaultJsonOption->count() > 0;
    std::optional<std::filesystem::path> providedDefaultPath;
    if (shouldSaveDefault && !setDefaultJsonPath.empty()) {
        providedDefaultPath = std::filesystem::absolute(setDefaultJsonPath);
    }

    RuntimeConfig runtimeConfig;
    if (!jsonInputText.empty()) {
        runtimeConfig = tristage::app::LoadRuntimeConfigFromJson(std::filesystem::absolute(jsonInputText),
                                                                 dumpRuntimeJson);
    } else if (providedDefaultPath) {
        runtimeConfig = tristage::app::LoadRuntimeConfigFromJson(*providedDefaultPath, dumpRuntimeJson);
    } else if (auto defaultPath = tristage::app::GetDefaultConfigPath();
               defaultPath && std::filesystem::exists(*defaultPath)) {
        runtimeConfig = tristage::app::LoadRuntimeConfigFromJson(*defaultPath, dumpRuntimeJson);
    } else {
        runtimeConfig = tristage::app::GenerateDefaultRuntimeConfig(argc > 0 ? argv[0] : nullptr);
    }
    if (forceProcedural) {
        runtimeConfig.pipelineMode = tristage::core::PipelineMode::Procedural;
    }

    AppOptions options;
    options.runtimeConfig = std::move(runtimeConfig);
    if (!seedOutputText.empty()) {
        options.seedOutput = std::filesystem::absolute(seedOutputText);
    }
    if (!snapshotText.empty()) {
        options.snapshotOutput = std::filesystem::absolute(snapshotText);
    }
    options.saveDefaultJson = shouldSaveDefault;
    options.dumpRuntimeJson = dumpRuntimeJson;
    options.traceEnabled = traceRuntime;
    options.luaDebug = luaDebug;
    return options;
}

void RenderSnapshot(const AppOptions& options) {
    TRACE_FUNCTION();
    const RuntimeConfig& config = options.runtimeConfig;
    tristage::script::SceneScript sceneScript(config.scriptPath, options.luaDebug);

    auto scene = sceneScript.LoadScene(config.pipelineMode);

    const auto& clear = scene.clearColor;
    tristage::core::ReferenceRasterizer rasterizer(config.width, config.height);
    rasterizer.Clear(tristage::core::FragmentColor(clear[0], clear[1], clear[2], clear[3]));
    // One Draw per range, so an incomplete primitive only drops within its own object.
    size_t fragments = 0;
    for (const auto& range : scene.drawRanges) {
        TraceLogger::Log("Snapshot draw with shader key " + range.shaderKey);
        std::vector<tristage::core::Vertex> rangeVertices;
        // Procedural ranges have no backing vertices.
        if (!scene.vertices.empty()) {
            auto first = scene.vertices.begin() + range.firstVertex;
            rangeVertices.assign(first, first + range.vertexCount);
        }
        fragments += rasterizer.Draw(config.pipelineMode, rangeVertices);
    }
    TRACE_VAR(fragments);
    rasterizer.WritePpm(*options.snapshotOutput);
    std::cout << "Wrote " << config.width << "x" << config.height << " snapshot to "
              << options.snapshotOutput->string() << '\n';
}

} // namespace

int main(int argc, char** argv) {
    try {
        AppOptions options = ParseCommandLine(argc, argv);
        if (options.seedOutput) {
            tristage::app::WriteRuntimeConfigJson(options.runtimeConfig, *options.seedOutput);
        }
        if (options.saveDefaultJson) {
            if (auto defaultPath = tristage::app::GetDefaultConfigPath()) {
                tristage::app::WriteRuntimeConfigJson(options.runtimeConfig, *defaultPath);
            } else {
                throw std::runtime_error("Unable to determine platform config directory");
            }
        }
        if (options.snapshotOutput) {
            RenderSnapshot(options);
            return EXIT_SUCCESS;
        }
        tristage::app::TriangleApp app(options.runtimeConfig, options.luaDebug);
        app.Run();
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
