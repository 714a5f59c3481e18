#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace kuf::blueprints {
class BlueprintStore;
}

namespace kuf::lua {

/// Global key for storing the BlueprintStore pointer accessible from C
/// bindings.
constexpr const char* REG_BLUEPRINT_STORE = "kuf_blueprint_store";

/// RAII wrapper around a Lua 5.1 state.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Set a global string variable.
    void set_global_string(const char* name, const char* value);

    /// Set a global number variable.
    void set_global_number(const char* name, f64 value);

    /// Set a global to an empty table.
    void set_global_table(const char* name);

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a script from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    /// Store a BlueprintStore pointer where the Register*Blueprint bindings
    /// can reach it.
    void set_blueprint_store(blueprints::BlueprintStore* store);

    /// Retrieve the BlueprintStore pointer from a lua_State.
    static blueprints::BlueprintStore* get_blueprint_store(lua_State* L);

private:
    lua_State* L_ = nullptr;
};

} // namespace kuf::lua
