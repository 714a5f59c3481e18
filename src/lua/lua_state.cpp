#include "lua/lua_state.hpp"
#include "blueprints/blueprint_store.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace kuf::lua {

namespace {

Result<void> pop_error(lua_State* L) {
    std::string err = lua_isstring(L, -1) ? lua_tostring(L, -1)
                                          : "unknown Lua error";
    lua_pop(L, 1);
    return Error(std::move(err));
}

} // namespace

LuaState::LuaState() {
    L_ = luaL_newstate();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    // Data scripts get the pure libraries only; no io or os access
    const luaL_Reg libs[] = {
        {"", luaopen_base},
        {LUA_TABLIBNAME, luaopen_table},
        {LUA_STRLIBNAME, luaopen_string},
        {LUA_MATHLIBNAME, luaopen_math},
    };
    for (const auto& lib : libs) {
        lua_pushcfunction(L_, lib.func);
        lua_pushstring(L_, lib.name);
        lua_call(L_, 1, 0);
    }
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_table(const char* name) {
    lua_newtable(L_);
    lua_setglobal(L_, name);
}

Result<void> LuaState::do_string(std::string_view code) {
    return do_buffer(code.data(), code.size(), "=string");
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error("Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return Error("Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    if (luaL_loadbuffer(L_, buf, len, name) != 0) {
        return pop_error(L_);
    }
    if (lua_pcall(L_, 0, 0, 0) != 0) {
        return pop_error(L_);
    }
    return {};
}

void LuaState::set_blueprint_store(blueprints::BlueprintStore* store) {
    lua_pushlightuserdata(L_, store);
    lua_setfield(L_, LUA_REGISTRYINDEX, REG_BLUEPRINT_STORE);
}

blueprints::BlueprintStore* LuaState::get_blueprint_store(lua_State* L) {
    lua_getfield(L, LUA_REGISTRYINDEX, REG_BLUEPRINT_STORE);
    auto* store = static_cast<blueprints::BlueprintStore*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return store;
}

} // namespace kuf::lua
