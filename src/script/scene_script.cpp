#include "script/scene_script.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace tristage::script {

namespace detail {

std::array<float, 3> ReadVector3(lua_State* L, int index, const char* what) {
    std::array<float, 3> result{};
    int absIndex = lua_absindex(L, index);
    if (!lua_istable(L, absIndex)) {
        throw std::runtime_error(std::string("Expected table for vertex ") + what);
    }
    size_t len = lua_rawlen(L, absIndex);
    if (len != 3) {
        throw std::runtime_error(std::string("Vertex ") + what + " must have 3 components, got " +
                                 std::to_string(len));
    }
    for (size_t i = 1; i <= 3; ++i) {
        lua_rawgeti(L, absIndex, static_cast<int>(i));
        if (!lua_isnumber(L, -1)) {
            lua_pop(L, 1);
            throw std::runtime_error(std::string("Vertex ") + what + " component is not a number");
        }
        result[i - 1] = static_cast<float>(lua_tonumber(L, -1));
        lua_pop(L, 1);
    }
    return result;
}

} // namespace detail

namespace {

constexpr std::array<float, 4> kDefaultClearColor = {0.1f, 0.2f, 0.3f, 1.0f};

} // namespace

SceneScript::SceneScript(const std::filesystem::path& scriptPath, bool debugEnabled)
    : L_(luaL_newstate()),
      scriptDirectory_(scriptPath.parent_path()),
      debugEnabled_(debugEnabled) {
    if (!L_) {
        throw std::runtime_error("Failed to create Lua state");
    }
    luaL_openlibs(L_);
    lua_pushboolean(L_, debugEnabled_);
    lua_setglobal(L_, "lua_debug");
    auto scriptDir = scriptPath.parent_path();
    if (!scriptDir.empty()) {
        lua_getglobal(L_, "package");
        if (lua_istable(L_, -1)) {
            lua_getfield(L_, -1, "path");
            const char* currentPath = lua_tostring(L_, -1);
            std::string newPath = scriptDir.string() + "/?.lua;";
            if (currentPath) {
                newPath += currentPath;
            }
            lua_pop(L_, 1);
            lua_pushstring(L_, newPath.c_str());
            lua_setfield(L_, -2, "path");
        }
        lua_pop(L_, 1);
    }
    if (luaL_dofile(L_, scriptPath.string().c_str()) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        lua_close(L_);
        L_ = nullptr;
        throw std::runtime_error("Failed to load Lua script: " + message);
    }
}

SceneScript::~SceneScript() {
    if (L_) {
        lua_close(L_);
    }
}

std::vector<SceneScript::SceneObject> SceneScript::LoadSceneObjects() {
    lua_getglobal(L_, "get_scene_objects");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("Lua function 'get_scene_objects' is missing");
    }
    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        throw std::runtime_error("Lua get_scene_objects failed: " + message);
    }
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("'get_scene_objects' did not return a table");
    }

    size_t count = lua_rawlen(L_, -1);
    std::vector<SceneObject> objects;
    objects.reserve(count);

    for (size_t i = 1; i <= count; ++i) {
        lua_rawgeti(L_, -1, static_cast<int>(i));
        if (!lua_istable(L_, -1)) {
            lua_pop(L_, 2);
            throw std::runtime_error("Scene object at index " + std::to_string(i) + " is not a table");
        }

        SceneObject object;
        lua_getfield(L_, -1, "vertices");
        try {
            object.vertices = ReadVertexArray(L_, -1);
        } catch (const std::exception& e) {
            lua_pop(L_, 3);
            throw std::runtime_error("Scene object " + std::to_string(i) + ": " + e.what());
        }
        lua_pop(L_, 1);
        if (object.vertices.empty()) {
            lua_pop(L_, 2);
            throw std::runtime_error("Scene object " + std::to_string(i) + " must supply at least one vertex");
        }

        lua_getfield(L_, -1, "shader_key");
        if (lua_isstring(L_, -1)) {
            object.shaderKey = lua_tostring(L_, -1);
        }
        lua_pop(L_, 1);

        objects.push_back(std::move(object));
        lua_pop(L_, 1);
    }

    lua_pop(L_, 1);
    return objects;
}

std::vector<core::Vertex> SceneScript::ReadVertexArray(lua_State* L, int index) {
    int absIndex = lua_absindex(L, index);
    if (!lua_istable(L, absIndex)) {
        throw std::runtime_error("Expected table for vertex data");
    }

    size_t count = lua_rawlen(L, absIndex);
    std::vector<core::Vertex> vertices;
    vertices.reserve(count);

    for (size_t i = 1; i <= count; ++i) {
        lua_rawgeti(L, absIndex, static_cast<int>(i));
        if (!lua_istable(L, -1)) {
            lua_pop(L, 1);
            throw std::runtime_error("Vertex entry at index " + std::to_string(i) + " is not a table");
        }

        int vertexIndex = lua_gettop(L);
        core::Vertex vertex{};

        lua_getfield(L, vertexIndex, "position");
        try {
            vertex.position = detail::ReadVector3(L, -1, "position");
        } catch (...) {
            lua_pop(L, 2);
            throw;
        }
        lua_pop(L, 1);

        lua_getfield(L, vertexIndex, "color");
        try {
            vertex.color = detail::ReadVector3(L, -1, "color");
        } catch (...) {
            lua_pop(L, 2);
            throw;
        }
        lua_pop(L, 1);

        lua_pop(L, 1);
        vertices.push_back(vertex);
    }

    return vertices;
}

std::unordered_map<std::string, SceneScript::ShaderPaths> SceneScript::LoadShaderPathsMap() {
    lua_getglobal(L_, "get_shader_paths");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("Lua function 'get_shader_paths' is missing");
    }
    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        throw std::runtime_error("Lua get_shader_paths failed: " + message);
    }
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("'get_shader_paths' did not return a table");
    }

    std::unordered_map<std::string, ShaderPaths> shaderMap;
    lua_pushnil(L_);
    while (lua_next(L_, -2) != 0) {
        if (lua_type(L_, -2) == LUA_TSTRING && lua_istable(L_, -1)) {
            std::string key = lua_tostring(L_, -2);
            try {
                shaderMap.emplace(key, ReadShaderPathsTable(L_, -1));
            } catch (const std::exception& e) {
                lua_pop(L_, 3);
                throw std::runtime_error("Shader variant '" + key + "': " + e.what());
            }
        }
        lua_pop(L_, 1);
    }

    lua_pop(L_, 1);
    if (shaderMap.empty()) {
        throw std::runtime_error("'get_shader_paths' did not return any shader variants");
    }
    return shaderMap;
}

SceneScript::ShaderPaths SceneScript::ReadShaderPathsTable(lua_State* L, int index) {
    ShaderPaths paths;
    int absIndex = lua_absindex(L, index);

    lua_getfield(L, absIndex, "vertex");
    if (!lua_isstring(L, -1)) {
        lua_pop(L, 1);
        throw std::runtime_error("Shader path 'vertex' must be a string");
    }
    paths.vertex = lua_tostring(L, -1);
    lua_pop(L, 1);

    lua_getfield(L, absIndex, "fragment");
    if (!lua_isstring(L, -1)) {
        lua_pop(L, 1);
        throw std::runtime_error("Shader path 'fragment' must be a string");
    }
    paths.fragment = lua_tostring(L, -1);
    lua_pop(L, 1);

    return paths;
}

std::array<float, 4> SceneScript::GetClearColor() {
    lua_getglobal(L_, "get_clear_color");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return kDefaultClearColor;
    }
    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        throw std::runtime_error("Lua get_clear_color failed: " + message);
    }
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("'get_clear_color' did not return a table");
    }

    std::array<float, 4> color = kDefaultClearColor;
    int absIndex = lua_absindex(L_, -1);
    size_t len = lua_rawlen(L_, absIndex);
    if (len < 3 || len > 4) {
        lua_pop(L_, 1);
        throw std::runtime_error("'get_clear_color' must return 3 or 4 components");
    }
    for (size_t i = 1; i <= len; ++i) {
        lua_rawgeti(L_, absIndex, static_cast<int>(i));
        if (!lua_isnumber(L_, -1)) {
            lua_pop(L_, 2);
            throw std::runtime_error("Clear color component is not a number");
        }
        color[i - 1] = static_cast<float>(lua_tonumber(L_, -1));
        lua_pop(L_, 1);
    }
    lua_pop(L_, 1);
    return color;
}

SceneScript::Scene SceneScript::LoadScene(core::PipelineMode mode) {
    Scene scene;
    scene.shaderPaths = LoadShaderPathsMap();
    if (scene.shaderPaths.empty()) {
        throw std::runtime_error("Lua script did not provide shader paths");
    }
    if (scene.shaderPaths.count(kDefaultShaderKey) != 0) {
        scene.defaultShaderKey = kDefaultShaderKey;
    } else {
        // Lexicographically smallest key, independent of hash order.
        scene.defaultShaderKey =
            std::min_element(scene.shaderPaths.begin(), scene.shaderPaths.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; })
                ->first;
    }
    scene.clearColor = GetClearColor();

    if (mode == core::PipelineMode::Procedural) {
        if (scene.shaderPaths.count(kProceduralShaderKey) == 0) {
            throw std::runtime_error("Lua script does not provide the 'procedural' shader variant");
        }
        scene.drawRanges.push_back({0, core::kProceduralVertexCount, kProceduralShaderKey, kProceduralShaderKey});
        return scene;
    }

    auto sceneObjects = LoadSceneObjects();
    if (sceneObjects.empty()) {
        throw std::runtime_error("Lua script did not provide any scene objects");
    }
    for (auto& object : sceneObjects) {
        DrawRange range;
        range.firstVertex = static_cast<uint32_t>(scene.vertices.size());
        range.vertexCount = static_cast<uint32_t>(object.vertices.size());
        range.requestedShaderKey = object.shaderKey;
        range.shaderKey =
            scene.shaderPaths.count(object.shaderKey) != 0 ? object.shaderKey : scene.defaultShaderKey;
        scene.drawRanges.push_back(std::move(range));
        scene.vertices.insert(scene.vertices.end(), object.vertices.begin(), object.vertices.end());
    }
    if (scene.vertices.empty()) {
        throw std::runtime_error("Aggregated scene geometry is empty");
    }
    return scene;
}

std::filesystem::path SceneScript::ResolveShaderPath(const std::string& path) const {
    std::filesystem::path resolved(path);
    if (resolved.is_absolute()) {
        return resolved;
    }
    return std::filesystem::weakly_canonical(scriptDirectory_.parent_path() / resolved);
}

std::filesystem::path SceneScript::GetScriptDirectory() const {
    return scriptDirectory_;
}

std::string SceneScript::LuaErrorMessage(lua_State* L) {
    const char* message = lua_tostring(L, -1);
    return message ? message : "unknown lua error";
}

} // namespace tristage::script
