#include "lua/blueprint_bindings.hpp"
#include "lua/lua_state.hpp"
#include "blueprints/blueprint_store.hpp"
#include "core/log.hpp"

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace kuf::lua {

static int register_blueprint(lua_State* L, blueprints::BlueprintType type) {
    luaL_checktype(L, 1, LUA_TTABLE);
    auto* store = LuaState::get_blueprint_store(L);
    if (!store) {
        return luaL_error(L, "BlueprintStore not initialized");
    }
    store->register_blueprint(L, type, 1);
    return 0;
}

static int l_RegisterEnemyBlueprint(lua_State* L) {
    return register_blueprint(L, blueprints::BlueprintType::Enemy);
}

static int l_RegisterBattlefieldBlueprint(lua_State* L) {
    // A battlefield without a layout places nothing; make sure the path
    // exists so scripts can append to it after registering.
    luaL_checktype(L, 1, LUA_TTABLE);
    lua_getfield(L, 1, "Layout");
    if (lua_isnil(L, -1)) {
        lua_newtable(L);
        lua_setfield(L, 1, "Layout");
    }
    lua_pop(L, 1);
    return register_blueprint(L, blueprints::BlueprintType::Battlefield);
}

void register_blueprint_store_bindings(LuaState& state) {
    state.register_function("RegisterEnemyBlueprint", l_RegisterEnemyBlueprint);
    state.register_function("RegisterBattlefieldBlueprint",
                            l_RegisterBattlefieldBlueprint);
}

void register_log_bindings(LuaState& state) {
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
    state.register_function("ALERT", log::l_ALERT);
}

} // namespace kuf::lua
