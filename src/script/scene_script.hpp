#ifndef TRISTAGE_SCRIPT_SCENE_SCRIPT_HPP
#define TRISTAGE_SCRIPT_SCENE_SCRIPT_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include <lua.hpp>

#include "core/triangle_stage.hpp"
#include "core/vertex.hpp"

namespace tristage::script {

class SceneScript {
public:
    explicit SceneScript(const std::filesystem::path& scriptPath, bool debugEnabled = false);
    ~SceneScript();

    SceneScript(const SceneScript&) = delete;
    SceneScript& operator=(const SceneScript&) = delete;

    struct ShaderPaths {
        std::string vertex;
        std::string fragment;
    };

    struct SceneObject {
        std::vector<core::Vertex> vertices;
        std::string shaderKey = "default";
    };

    // One draw call over a slice of Scene::vertices. requestedShaderKey is what
    // the script asked for; shaderKey is the variant actually used.
    struct DrawRange {
        uint32_t firstVertex = 0;
        uint32_t vertexCount = 0;
        std::string shaderKey;
        std::string requestedShaderKey;
    };

    // Everything one frame needs, resolved the same way for the GPU and the
    // CPU snapshot.
    struct Scene {
        std::unordered_map<std::string, ShaderPaths> shaderPaths;
        std::string defaultShaderKey;
        std::vector<core::Vertex> vertices;
        std::vector<DrawRange> drawRanges;
        std::array<float, 4> clearColor{};
    };

    static constexpr const char* kDefaultShaderKey = "default";
    static constexpr const char* kProceduralShaderKey = "procedural";

    // Procedural mode draws the 3 synthesized corners with the 'procedural'
    // variant and reads no scene objects.
    Scene LoadScene(core::PipelineMode mode);

    std::vector<SceneObject> LoadSceneObjects();
    std::unordered_map<std::string, ShaderPaths> LoadShaderPathsMap();
    std::array<float, 4> GetClearColor();

    // Relative shader paths are relative to the project root, the parent of
    // the scripts directory.
    std::filesystem::path ResolveShaderPath(const std::string& path) const;
    std::filesystem::path GetScriptDirectory() const;

private:
    static std::vector<core::Vertex> ReadVertexArray(lua_State* L, int index);
    static std::string LuaErrorMessage(lua_State* L);
    static ShaderPaths ReadShaderPathsTable(lua_State* L, int index);

    lua_State* L_ = nullptr;
    std::filesystem::path scriptDirectory_;
    bool debugEnabled_ = false;
};

} // namespace tristage::script

#endif // TRISTAGE_SCRIPT_SCENE_SCRIPT_HPP
