#include "blueprints/blueprint_store.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace kuf::blueprints {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

} // namespace

const char* blueprint_type_name(BlueprintType type) {
    switch (type) {
    case BlueprintType::Enemy: return "Enemy";
    case BlueprintType::Battlefield: return "Battlefield";
    }
    return "Unknown";
}

BlueprintStore::BlueprintStore(lua_State* L) : L_(L) {}

BlueprintStore::~BlueprintStore() {
    for (auto& entry : blueprints_) {
        if (entry.lua_ref != LUA_NOREF && entry.lua_ref != -1) {
            luaL_unref(L_, LUA_REGISTRYINDEX, entry.lua_ref);
        }
    }
}

void BlueprintStore::register_blueprint(lua_State* L, BlueprintType type,
                                        int stack_index) {
    // Copy to std::string immediately; lua_tostring pointers are only
    // valid while the value is on the stack.
    std::string id;
    lua_pushstring(L, "BlueprintId");
    lua_gettable(L, stack_index);
    if (lua_isstring(L, -1) && lua_strlen(L, -1) > 0) {
        id = lua_tostring(L, -1);
    }
    lua_pop(L, 1);

    if (id.empty()) {
        spdlog::warn("{} blueprint with no BlueprintId, skipping",
                     blueprint_type_name(type));
        return;
    }
    id = to_lower(id);

    std::string source;
    lua_Debug ar;
    if (lua_getstack(L, 1, &ar) && lua_getinfo(L, "S", &ar)) {
        source = ar.short_src;
    }

    lua_pushvalue(L, stack_index);
    int ref = luaL_ref(L, LUA_REGISTRYINDEX);

    BlueprintEntry entry;
    entry.type = type;
    entry.id = id;
    entry.source = std::move(source);
    entry.lua_ref = ref;

    auto it = index_.find(id);
    if (it != index_.end()) {
        BlueprintEntry& existing = blueprints_[it->second];
        if (existing.type != type) {
            spdlog::warn("Blueprint '{}' re-registered as {} (was {})", id,
                         blueprint_type_name(type),
                         blueprint_type_name(existing.type));
        }
        luaL_unref(L_, LUA_REGISTRYINDEX, existing.lua_ref);
        existing = std::move(entry);
        spdlog::debug("Replaced {} blueprint '{}'", blueprint_type_name(type),
                      id);
        return;
    }

    index_[id] = blueprints_.size();
    blueprints_.push_back(std::move(entry));
    spdlog::debug("Registered {} blueprint '{}'", blueprint_type_name(type), id);
}

const BlueprintEntry* BlueprintStore::find(std::string_view id) const {
    auto it = index_.find(to_lower(id));
    return (it != index_.end()) ? &blueprints_[it->second] : nullptr;
}

std::vector<const BlueprintEntry*> BlueprintStore::get_all(
    BlueprintType type) const {
    std::vector<const BlueprintEntry*> result;
    for (const auto& entry : blueprints_) {
        if (entry.type == type) {
            result.push_back(&entry);
        }
    }
    return result;
}

size_t BlueprintStore::count(BlueprintType type) const {
    return static_cast<size_t>(
        std::count_if(blueprints_.begin(), blueprints_.end(),
                      [type](const BlueprintEntry& e) { return e.type == type; }));
}

void BlueprintStore::push_lua_table(const BlueprintEntry& entry) const {
    lua_rawgeti(L_, LUA_REGISTRYINDEX, entry.lua_ref);
}

std::optional<std::string> BlueprintStore::get_string_field(
    const BlueprintEntry& entry, const char* field) const {
    push_lua_table(entry);
    lua_pushstring(L_, field);
    lua_gettable(L_, -2);
    std::optional<std::string> result;
    if (lua_type(L_, -1) == LUA_TSTRING) {
        result = lua_tostring(L_, -1);
    }
    lua_pop(L_, 2); // pop value and table
    return result;
}

std::optional<double> BlueprintStore::get_number_field(
    const BlueprintEntry& entry, const char* field) const {
    push_lua_table(entry);
    lua_pushstring(L_, field);
    lua_gettable(L_, -2);
    std::optional<double> result;
    if (lua_type(L_, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L_, -1);
    }
    lua_pop(L_, 2);
    return result;
}

std::optional<bool> BlueprintStore::get_bool_field(
    const BlueprintEntry& entry, const char* field) const {
    push_lua_table(entry);
    lua_pushstring(L_, field);
    lua_gettable(L_, -2);
    std::optional<bool> result;
    if (lua_isboolean(L_, -1)) {
        result = lua_toboolean(L_, -1) != 0;
    }
    lua_pop(L_, 2);
    return result;
}

void BlueprintStore::log_statistics() const {
    spdlog::info("Blueprint loading complete:");
    spdlog::info("  Enemies:      {}", count(BlueprintType::Enemy));
    spdlog::info("  Battlefields: {}", count(BlueprintType::Battlefield));
    spdlog::info("  Total:        {}", total_count());
}

} // namespace kuf::blueprints
