#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct lua_State;

namespace kuf::blueprints {

enum class BlueprintType {
    Enemy,
    Battlefield,
};

const char* blueprint_type_name(BlueprintType type);

struct BlueprintEntry {
    BlueprintType type;
    std::string id;     ///< Lowercase blueprint ID (e.g., "small_turret")
    std::string source; ///< Script the blueprint was registered from
    int lua_ref = -1;   ///< Lua registry reference to the blueprint table
};

/// Registry of every blueprint the data scripts declared.
/// Stores blueprints as Lua table references; conversion into simulation
/// types happens in lua::BattlefieldLoader.
class BlueprintStore {
public:
    explicit BlueprintStore(lua_State* L);
    ~BlueprintStore();

    BlueprintStore(const BlueprintStore&) = delete;
    BlueprintStore& operator=(const BlueprintStore&) = delete;

    /// Called by Register*Blueprint C functions.
    /// Reads BlueprintId from the table at stack_index and stores it.
    /// Re-registering an id replaces the table but keeps its position.
    void register_blueprint(lua_State* L, BlueprintType type, int stack_index);

    /// Find a blueprint by ID (case-insensitive).
    const BlueprintEntry* find(std::string_view id) const;

    /// All blueprints of a given type, in registration order.
    std::vector<const BlueprintEntry*> get_all(BlueprintType type) const;

    size_t count(BlueprintType type) const;
    size_t total_count() const { return blueprints_.size(); }

    /// Push the Lua table for a blueprint onto the stack.
    void push_lua_table(const BlueprintEntry& entry) const;

    std::optional<std::string> get_string_field(const BlueprintEntry& entry,
                                                const char* field) const;
    std::optional<double> get_number_field(const BlueprintEntry& entry,
                                           const char* field) const;
    std::optional<bool> get_bool_field(const BlueprintEntry& entry,
                                       const char* field) const;

    lua_State* lua() const { return L_; }

    void log_statistics() const;

private:
    lua_State* L_;
    std::vector<BlueprintEntry> blueprints_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace kuf::blueprints
