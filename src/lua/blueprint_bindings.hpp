#pragma once

struct lua_State;

namespace kuf::lua {

class LuaState;

/// Register RegisterEnemyBlueprint and RegisterBattlefieldBlueprint.
/// The state must have a BlueprintStore attached.
void register_blueprint_store_bindings(LuaState& state);

/// Register the LOG/WARN/SPEW/ALERT script logging globals.
void register_log_bindings(LuaState& state);

} // namespace kuf::lua
