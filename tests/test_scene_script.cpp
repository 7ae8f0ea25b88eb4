#include "script/scene_script.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::filesystem::path GetTestScriptPath(const std::string& name) {
    auto testDir = std::filesystem::path(__FILE__).parent_path();
    return testDir / "scripts" / name;
}

void Assert(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "test failure: " << message << '\n';
        ++failures;
    }
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void TestUnitFixture(int& failures) {
    auto scriptPath = GetTestScriptPath("unit_triangle_scene.lua");
    std::cout << "Loading Lua fixture: " << scriptPath << '\n';
    tristage::script::SceneScript sceneScript(scriptPath);

    auto objects = sceneScript.LoadSceneObjects();
    Assert(objects.size() == 2, "expected two scene objects", failures);
    if (objects.size() == 2) {
        const auto& triangle = objects[0];
        Assert(triangle.vertices.size() == 3, "first object should yield three vertices", failures);
        Assert(triangle.shaderKey == "test", "shader key should match fixture", failures);
        if (triangle.vertices.size() == 3) {
            const auto& top = triangle.vertices[0];
            Assert(top.position[0] == 0.0f && top.position[1] == 0.5f && top.position[2] == 0.0f,
                   "first vertex position", failures);
            Assert(top.color[0] == 1.0f && top.color[1] == 0.0f && top.color[2] == 0.0f, "first vertex color",
                   failures);
            const auto& right = triangle.vertices[2];
            Assert(right.position[0] == 0.5f && right.position[1] == -0.5f, "third vertex position", failures);
            Assert(right.color[2] == 1.0f, "third vertex color", failures);
        }
        Assert(objects[1].shaderKey == "default", "missing shader_key falls back to default", failures);
        Assert(objects[1].vertices.size() == 1, "second object keeps its single vertex", failures);
    }

    auto shaderMap = sceneScript.LoadShaderPathsMap();
    Assert(shaderMap.size() == 1, "non-string shader keys are ignored", failures);
    auto testEntry = shaderMap.find("test");
    Assert(testEntry != shaderMap.end(), "shader map missing test entry", failures);
    if (testEntry != shaderMap.end()) {
        Assert(testEntry->second.vertex == "shaders/test.vert.spv", "vertex shader path", failures);
        Assert(testEntry->second.fragment == "shaders/test.frag.spv", "fragment shader path", failures);
    }

    auto clear = sceneScript.GetClearColor();
    Assert(clear[0] == 0.0f && clear[1] == 0.0f && clear[2] == 0.0f, "clear color rgb from fixture", failures);
    Assert(clear[3] == 1.0f, "three-component clear color keeps alpha 1", failures);

    auto projectRoot = scriptPath.parent_path().parent_path();
    Assert(sceneScript.ResolveShaderPath("shaders/test.vert.spv") ==
               std::filesystem::weakly_canonical(projectRoot / "shaders" / "test.vert.spv"),
           "relative shader paths resolve against the project root", failures);
    Assert(sceneScript.GetScriptDirectory() == scriptPath.parent_path(), "script directory", failures);
}

void TestMinimalFixture(int& failures) {
    for (bool debug : {false, true}) {
        tristage::script::SceneScript sceneScript(GetTestScriptPath("minimal_triangle_scene.lua"), debug);
        auto clear = sceneScript.GetClearColor();
        Assert(clear[0] == 0.1f && clear[1] == 0.2f && clear[2] == 0.3f && clear[3] == 1.0f,
               "missing get_clear_color yields the default clear color", failures);

        auto shaderMap = sceneScript.LoadShaderPathsMap();
        auto entry = shaderMap.find("default");
        Assert(entry != shaderMap.end(), "default shader variant present", failures);
        if (entry != shaderMap.end()) {
            auto absolute = std::filesystem::path(entry->second.vertex);
            if (absolute.is_absolute()) {
                Assert(sceneScript.ResolveShaderPath(entry->second.vertex) == absolute,
                       "absolute shader paths are kept as-is", failures);
            }
        }
        Assert(sceneScript.LoadSceneObjects().size() == 1, "minimal fixture has one object", failures);
    }
}

void TestMalformedFixture(int& failures) {
    tristage::script::SceneScript sceneScript(GetTestScriptPath("malformed_triangle_scene.lua"));

    try {
        sceneScript.LoadSceneObjects();
        Assert(false, "two-component position should be rejected", failures);
    } catch (const std::runtime_error& ex) {
        Assert(Contains(ex.what(), "Scene object 1"), "error names the scene object", failures);
        Assert(Contains(ex.what(), "position"), "error names the offending field", failures);
    }

    try {
        sceneScript.LoadShaderPathsMap();
        Assert(false, "empty shader map should be rejected", failures);
    } catch (const std::runtime_error& ex) {
        Assert(Contains(ex.what(), "get_shader_paths"), "error names the Lua function", failures);
    }

    bool threw = false;
    try {
        sceneScript.GetClearColor();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Assert(threw, "two-component clear color should be rejected", failures);

    // The script stays usable after errors; the Lua stack must be balanced.
    try {
        sceneScript.LoadSceneObjects();
        Assert(false, "second load should fail the same way", failures);
    } catch (const std::runtime_error& ex) {
        Assert(Contains(ex.what(), "Scene object 1"), "repeated error is unchanged", failures);
    }
}

void TestResolvedScene(int& failures) {
    using tristage::core::PipelineMode;

    tristage::script::SceneScript unitScript(GetTestScriptPath("unit_triangle_scene.lua"));
    auto scene = unitScript.LoadScene(PipelineMode::VertexBuffer);
    Assert(scene.defaultShaderKey == "test", "only variant becomes the default", failures);
    Assert(scene.vertices.size() == 4, "vertices from both objects are concatenated", failures);
    Assert(scene.drawRanges.size() == 2, "one draw range per scene object", failures);
    if (scene.drawRanges.size() == 2) {
        const auto& first = scene.drawRanges[0];
        Assert(first.firstVertex == 0 && first.vertexCount == 3 && first.shaderKey == "test",
               "first range covers the triangle with its own key", failures);
        const auto& second = scene.drawRanges[1];
        Assert(second.firstVertex == 3 && second.vertexCount == 1, "second range follows the first", failures);
        Assert(second.requestedShaderKey == "default" && second.shaderKey == "test",
               "unknown key falls back to the default variant", failures);
    }
    Assert(scene.clearColor[3] == 1.0f, "clear color is resolved with the scene", failures);

    try {
        unitScript.LoadScene(PipelineMode::Procedural);
        Assert(false, "procedural mode without a procedural variant should be rejected", failures);
    } catch (const std::runtime_error& ex) {
        Assert(Contains(ex.what(), "procedural"), "error names the missing variant", failures);
    }

    // Same answer on every load, whatever the hash order of the shader map.
    tristage::script::SceneScript variantsScript(GetTestScriptPath("variants_triangle_scene.lua"));
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto variants = variantsScript.LoadScene(PipelineMode::VertexBuffer);
        Assert(variants.defaultShaderKey == "alpha", "smallest key is the fallback default", failures);
        if (variants.drawRanges.size() == 2) {
            Assert(variants.drawRanges[0].shaderKey == "zeta", "known key is kept", failures);
            Assert(variants.drawRanges[1].shaderKey == "alpha", "unknown key uses the fallback", failures);
        } else {
            Assert(false, "variants fixture should give two ranges", failures);
        }
    }

    auto procedural = variantsScript.LoadScene(PipelineMode::Procedural);
    Assert(procedural.vertices.empty(), "procedural scene has no vertex data", failures);
    Assert(procedural.drawRanges.size() == 1, "procedural scene is one draw", failures);
    if (procedural.drawRanges.size() == 1) {
        Assert(procedural.drawRanges[0].vertexCount == 3 && procedural.drawRanges[0].shaderKey == "procedural",
               "procedural draw uses three vertices and its own variant", failures);
    }
}

void TestMissingScript(int& failures) {
    bool threw = false;
    try {
        tristage::script::SceneScript sceneScript(GetTestScriptPath("does_not_exist.lua"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Assert(threw, "missing script should throw on load", failures);
}

} // namespace

int main() {
    int failures = 0;

    try {
        TestUnitFixture(failures);
        TestMinimalFixture(failures);
        TestMalformedFixture(failures);
        TestResolvedScene(failures);
        TestMissingScript(failures);
    } catch (const std::exception& ex) {
        std::cerr << "exception during tests: " << ex.what() << '\n';
        return 1;
    }

    if (failures == 0) {
        std::cout << "scene_script_tests: PASSED\n";
    } else {
        std::cerr << "scene_script_tests: FAILED (" << failures << " errors)\n";
    }

    return failures;
}
