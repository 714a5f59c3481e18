#include "lua/battlefield_loader.hpp"
#include "lua/blueprint_bindings.hpp"
#include "lua/lua_state.hpp"
#include "blueprints/blueprint_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <optional>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace kuf::lua {

namespace {

/// Typed field access on the Lua table at an absolute stack index.
/// Absent fields leave the output untouched; a present field of the wrong
/// type records the first error and is otherwise ignored.
class TableReader {
public:
    TableReader(lua_State* L, int index, std::string scope)
        : L_(L), index_(index), scope_(std::move(scope)) {}

    bool number(const char* key, f32& out) {
        lua_getfield(L_, index_, key);
        bool found = false;
        if (lua_type(L_, -1) == LUA_TNUMBER) {
            out = static_cast<f32>(lua_tonumber(L_, -1));
            found = true;
        } else if (!lua_isnil(L_, -1)) {
            fail(key, "a number");
        }
        lua_pop(L_, 1);
        return found;
    }

    bool integer(const char* key, i32& out) {
        f32 value = 0;
        if (!number(key, value)) return false;
        if (value != std::floor(value)) {
            fail(key, "a whole number");
            return false;
        }
        out = static_cast<i32>(value);
        return true;
    }

    bool count(const char* key, u32& out) {
        i32 value = 0;
        if (!integer(key, value)) return false;
        if (value < 0) {
            fail(key, "non-negative");
            return false;
        }
        out = static_cast<u32>(value);
        return true;
    }

    bool text(const char* key, std::string& out) {
        lua_getfield(L_, index_, key);
        bool found = false;
        if (lua_type(L_, -1) == LUA_TSTRING) {
            out = lua_tostring(L_, -1);
            found = true;
        } else if (!lua_isnil(L_, -1)) {
            fail(key, "a string");
        }
        lua_pop(L_, 1);
        return found;
    }

    bool flag(const char* key, bool& out) {
        lua_getfield(L_, index_, key);
        bool found = false;
        if (lua_isboolean(L_, -1)) {
            out = lua_toboolean(L_, -1) != 0;
            found = true;
        } else if (!lua_isnil(L_, -1)) {
            fail(key, "a boolean");
        }
        lua_pop(L_, 1);
        return found;
    }

    /// Run `fn` with a reader over the sub-table `key`, if present.
    template <typename Fn>
    bool table(const char* key, Fn&& fn) {
        lua_getfield(L_, index_, key);
        if (!lua_istable(L_, -1)) {
            if (!lua_isnil(L_, -1)) fail(key, "a table");
            lua_pop(L_, 1);
            return false;
        }
        TableReader child(L_, lua_gettop(L_), scope_ + "." + key);
        fn(child);
        if (child.error_ && !error_) error_ = child.error_;
        lua_pop(L_, 1);
        return true;
    }

    void fail(const std::string& key, const std::string& expected) {
        if (!error_) error_ = Error(scope_ + "." + key + " must be " + expected);
    }

    lua_State* raw() const { return L_; }
    int index() const { return index_; }
    const std::string& scope() const { return scope_; }
    bool ok() const { return !error_.has_value(); }
    const Error& error() const { return *error_; }

private:
    lua_State* L_;
    int index_;
    std::string scope_;
    std::optional<Error> error_;
};

template <typename T>
struct NumberField {
    const char* key;
    f32 T::*member;
};

template <typename T, size_t N>
void read_numbers(TableReader& reader, T& target,
                  const NumberField<T> (&fields)[N]) {
    for (const auto& field : fields) {
        reader.number(field.key, target.*field.member);
    }
}

const NumberField<sim::UnitProfile> PROFILE_FIELDS[] = {
    {"Radius", &sim::UnitProfile::radius},
    {"MoveSpeed", &sim::UnitProfile::move_speed},
    {"Range", &sim::UnitProfile::range},
    {"BulletSpeed", &sim::UnitProfile::bullet_speed},
};

const NumberField<sim::SimConfig> CONFIG_FIELDS[] = {
    {"UnitAcceleration", &sim::SimConfig::unit_acceleration},
    {"ArrivalTolerance", &sim::SimConfig::arrival_tolerance},
    {"TargetHoldBuffer", &sim::SimConfig::target_hold_buffer},
    {"SplayerRocketDamageScale", &sim::SimConfig::splayer_rocket_damage_scale},
    {"SplayerBaseSpinSpeed", &sim::SimConfig::splayer_base_spin_speed},
    {"SplayerSpinBoostMultiplier", &sim::SimConfig::splayer_spin_boost_multiplier},
    {"SplayerSpinBoostDuration", &sim::SimConfig::splayer_spin_boost_duration},
    {"TurretBulletSpeed", &sim::SimConfig::turret_bullet_speed},
    {"BulletLife", &sim::SimConfig::bullet_life},
    {"HomingTurnRate", &sim::SimConfig::homing_turn_rate},
    {"BulletCullingMargin", &sim::SimConfig::bullet_culling_margin},
    {"MineExplosionRadius", &sim::SimConfig::mine_explosion_radius},
    {"ExplosionLife", &sim::SimConfig::explosion_life},
    {"BarracksSpawnOffset", &sim::SimConfig::barracks_spawn_offset},
    {"SupportHealVisual", &sim::SimConfig::support_heal_visual},
    {"FieldPulsePeriod", &sim::SimConfig::field_pulse_period},
    {"MinSlowMultiplier", &sim::SimConfig::min_slow_multiplier},
    {"MinEffectSlow", &sim::SimConfig::min_effect_slow},
    {"MaxFieldSlowAmount", &sim::SimConfig::max_field_slow_amount},
    {"WorkerBaseCost", &sim::SimConfig::worker_base_cost},
    {"WorkerCostIncrement", &sim::SimConfig::worker_cost_increment},
    {"StartingGoldPerLevel", &sim::SimConfig::starting_gold_per_level},
    {"SpawnJitter", &sim::SimConfig::spawn_jitter},
    {"SpawnAreaMargin", &sim::SimConfig::spawn_area_margin},
    {"GridUnit", &sim::SimConfig::grid_unit},
    {"GridOriginBottomOffset", &sim::SimConfig::grid_origin_bottom_offset},
    {"LaneExitY", &sim::SimConfig::lane_exit_y},
    {"CameraSmoothing", &sim::SimConfig::camera_smoothing},
    {"EnemyTapPadding", &sim::SimConfig::enemy_tap_padding},
    {"MaxFrameDelta", &sim::SimConfig::max_frame_delta},
};

const NumberField<sim::CoreShipCombatConfig> CORE_SHIP_FIELDS[] = {
    {"CannonRange", &sim::CoreShipCombatConfig::cannon_range},
    {"CannonSpread", &sim::CoreShipCombatConfig::cannon_spread},
    {"CannonProjectileSpeed", &sim::CoreShipCombatConfig::cannon_projectile_speed},
    {"CannonDamage", &sim::CoreShipCombatConfig::cannon_damage},
    {"CannonAttackSpeed", &sim::CoreShipCombatConfig::cannon_attack_speed},
    {"CollisionScale", &sim::CoreShipCombatConfig::collision_scale},
    {"BaseRadius", &sim::CoreShipCombatConfig::base_radius},
    {"HealingAuraRadius", &sim::CoreShipCombatConfig::healing_aura_radius},
    {"ShieldPerUpgrade", &sim::CoreShipCombatConfig::shield_per_upgrade},
    {"ShieldRegenBase", &sim::CoreShipCombatConfig::shield_regen_base},
    {"ShieldRegenPerUpgrade", &sim::CoreShipCombatConfig::shield_regen_per_upgrade},
    {"ShieldRegenDelay", &sim::CoreShipCombatConfig::shield_regen_delay},
    {"RepairInterval", &sim::CoreShipCombatConfig::repair_interval},
    {"DroneSpawnOffset", &sim::CoreShipCombatConfig::drone_spawn_offset},
};

const NumberField<sim::DroneConfig> DRONE_FIELDS[] = {
    {"Radius", &sim::DroneConfig::radius},
    {"AttackSpeed", &sim::DroneConfig::attack_speed},
    {"MoveSpeed", &sim::DroneConfig::move_speed},
    {"Range", &sim::DroneConfig::range},
};

Result<void> prepare(LuaState& state, blueprints::BlueprintStore& store) {
    if (!state.raw()) return Error("Failed to create Lua state");
    state.set_blueprint_store(&store);
    register_blueprint_store_bindings(state);
    register_log_bindings(state);
    return {};
}

void read_effect(TableReader& t, sim::EnemyArchetype& a) {
    sim::EffectPayload effect = a.projectile_effects.value_or(sim::EffectPayload{});
    std::string kind = effect.kind == sim::StatusKind::Slow ? "slow" : "burn";
    t.text("Kind", kind);
    if (kind == "burn") {
        effect.kind = sim::StatusKind::Burn;
    } else if (kind == "slow") {
        effect.kind = sim::StatusKind::Slow;
    } else {
        t.fail("Kind", "\"burn\" or \"slow\"");
    }
    t.number("Magnitude", effect.magnitude);
    t.number("Duration", effect.duration);
    a.projectile_effects = effect;
}

void read_enemy(TableReader& r, sim::EnemyArchetype& a) {
    r.text("Name", a.name);
    r.number("Radius", a.radius);
    r.number("Health", a.health);
    r.number("Attack", a.attack);
    r.number("AttackSpeed", a.attack_speed);
    r.number("Range", a.range);
    r.number("GoldValue", a.gold_value);
    r.number("ProjectileSpeed", a.projectile_speed);
    r.count("MultiShot", a.multi_shot);
    f32 spread_degrees = 0;
    if (r.number("SpreadDegrees", spread_degrees))
        a.spread_angle = spread_degrees * PI / 180.0f;
    r.flag("Wall", a.is_wall);
    r.flag("Structure", a.is_structure);

    r.table("Effect", [&](TableReader& t) { read_effect(t, a); });
    r.table("Mine", [&](TableReader& t) {
        sim::MineTraits mine = a.mine.value_or(sim::MineTraits{});
        t.number("ExplosionRadius", mine.explosion_radius);
        a.mine = mine;
    });
    r.table("Barracks", [&](TableReader& t) {
        sim::BarracksTraits b = a.barracks.value_or(sim::BarracksTraits{});
        t.text("SpawnType", b.spawn_type);
        t.number("SpawnRange", b.spawn_range);
        t.number("SpawnCooldown", b.spawn_cooldown);
        t.count("MaxSpawns", b.max_spawns);
        if (b.spawn_type.empty()) t.fail("SpawnType", "set");
        a.barracks = b;
    });
    r.table("Support", [&](TableReader& t) {
        sim::SupportTraits s = a.support.value_or(sim::SupportTraits{});
        t.number("HealRange", s.heal_range);
        t.number("HealPerSecond", s.heal_per_second);
        a.support = s;
    });
    r.table("Mobile", [&](TableReader& t) {
        sim::MobileTraits m = a.mobile.value_or(sim::MobileTraits{});
        t.number("MoveSpeed", m.move_speed);
        t.number("SightRange", m.sight_range);
        a.mobile = m;
    });
    r.table("StasisField", [&](TableReader& t) {
        sim::StasisFieldTraits f = a.stasis_field.value_or(sim::StasisFieldTraits{});
        t.number("SlowRadius", f.slow_radius);
        t.number("SlowAmount", f.slow_amount);
        a.stasis_field = f;
    });
    r.table("BuffNode", [&](TableReader& t) {
        sim::BuffNodeTraits b = a.buff_node.value_or(sim::BuffNodeTraits{});
        t.number("BuffRadius", b.buff_radius);
        t.number("AttackSpeedMultiplier", b.attack_speed_multiplier);
        t.number("DamageMultiplier", b.damage_multiplier);
        a.buff_node = b;
    });

    if (a.radius <= 0) r.fail("Radius", "positive");
    if (a.health <= 0) r.fail("Health", "positive");
    if (a.multi_shot == 0) r.fail("MultiShot", "at least 1");
}

} // namespace

Result<size_t> BattlefieldLoader::run_scripts(LuaState& state,
                                              const fs::path& data_dir) {
    std::error_code ec;
    if (!fs::is_directory(data_dir, ec)) {
        return Error("Data directory not found: " + data_dir.string());
    }

    std::vector<fs::path> scripts;
    for (const auto& entry : fs::directory_iterator(data_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".lua") {
            scripts.push_back(entry.path());
        }
    }
    if (ec) {
        return Error("Failed to list " + data_dir.string() + ": " + ec.message());
    }
    std::sort(scripts.begin(), scripts.end());

    for (const auto& script : scripts) {
        spdlog::debug("Running data script {}", script.string());
        auto result = state.do_file(script);
        if (!result) {
            return result.error().with_context(script.filename().string());
        }
    }
    return scripts.size();
}

Result<size_t> BattlefieldLoader::load_enemies(
    const blueprints::BlueprintStore& store, sim::EnemyCatalog& catalog) {
    lua_State* L = store.lua();
    size_t loaded = 0;

    for (const auto* entry : store.get_all(blueprints::BlueprintType::Enemy)) {
        const sim::EnemyArchetype* existing = catalog.find(entry->id);
        sim::EnemyArchetype archetype;
        if (existing) {
            archetype = *existing;
        } else {
            archetype.type = entry->id;
            archetype.name = entry->id;
            archetype.radius = 0;
            archetype.health = 0;
        }

        store.push_lua_table(*entry);
        TableReader reader(L, lua_gettop(L), "enemy '" + entry->id + "'");
        read_enemy(reader, archetype);
        lua_pop(L, 1);
        if (!reader.ok()) {
            return reader.error();
        }

        spdlog::debug("{} enemy '{}' from {}", existing ? "Overrode" : "Added",
                      entry->id, entry->source);
        catalog.add(std::move(archetype));
        loaded++;
    }

    for (const auto& a : catalog.archetypes()) {
        if (a.barracks && !catalog.find(a.barracks->spawn_type)) {
            spdlog::warn("Barracks '{}' spawns unknown enemy type '{}'", a.type,
                         a.barracks->spawn_type);
        }
    }
    return loaded;
}

Result<size_t> BattlefieldLoader::load_maps(
    const blueprints::BlueprintStore& store, const sim::EnemyCatalog& catalog,
    sim::MapLibrary& maps) {
    lua_State* L = store.lua();
    size_t loaded = 0;

    for (const auto* entry :
         store.get_all(blueprints::BlueprintType::Battlefield)) {
        sim::BattlefieldMap map;
        map.id = entry->id;
        map.name = store.get_string_field(*entry, "Name").value_or(entry->id);
        map.description =
            store.get_string_field(*entry, "Description").value_or("");

        store.push_lua_table(*entry);
        TableReader reader(L, lua_gettop(L), "battlefield '" + entry->id + "'");
        reader.table("Layout", [&](TableReader& layout) {
            for (int i = 1;; i++) {
                lua_rawgeti(L, layout.index(), i);
                if (lua_isnil(L, -1)) {
                    lua_pop(L, 1);
                    break;
                }
                std::string key = "[" + std::to_string(i) + "]";
                if (!lua_istable(L, -1)) {
                    layout.fail(key, "a table");
                    lua_pop(L, 1);
                    break;
                }
                TableReader item(L, lua_gettop(L), layout.scope() + key);
                sim::LayoutEntry placed;
                item.text("Type", placed.type);
                item.integer("X", placed.grid_x);
                item.integer("Y", placed.grid_y);
                item.count("Level", placed.level);
                lua_pop(L, 1);

                if (!item.ok()) {
                    layout.fail(key, "a valid layout entry (" +
                                         item.error().message + ")");
                    break;
                }
                if (placed.type.empty()) {
                    layout.fail(key + ".Type", "set");
                    break;
                }
                if (placed.level == 0) {
                    spdlog::warn("{}{}: level 0 raised to 1", layout.scope(), key);
                    placed.level = 1;
                }
                if (!catalog.find(placed.type)) {
                    spdlog::warn("{}{}: unknown enemy type '{}'", layout.scope(),
                                 key, placed.type);
                }
                map.layout.push_back(std::move(placed));
            }
        });
        lua_pop(L, 1);
        if (!reader.ok()) {
            return reader.error();
        }

        spdlog::debug("Battlefield '{}' ({}): {} placements", map.id, map.name,
                      map.layout.size());
        maps.add(std::move(map));
        loaded++;
    }
    return loaded;
}

Result<bool> BattlefieldLoader::load_tuning(LuaState& state,
                                            sim::SimConfig& config) {
    lua_State* L = state.raw();
    lua_getglobal(L, "KufTuning");
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return false;
    }
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("KufTuning must be a table");
    }

    TableReader reader(L, lua_gettop(L), "KufTuning");
    read_numbers(reader, config, CONFIG_FIELDS);
    reader.count("SplayerRocketCount", config.splayer_rocket_count);
    reader.count("LaserPierceCount", config.laser_pierce_count);

    reader.table("Marine", [&](TableReader& t) {
        read_numbers(t, config.marine, PROFILE_FIELDS);
    });
    reader.table("Sniper", [&](TableReader& t) {
        read_numbers(t, config.sniper, PROFILE_FIELDS);
    });
    reader.table("Splayer", [&](TableReader& t) {
        read_numbers(t, config.splayer, PROFILE_FIELDS);
    });
    reader.table("Laser", [&](TableReader& t) {
        read_numbers(t, config.laser, PROFILE_FIELDS);
    });
    reader.table("CoreShip", [&](TableReader& t) {
        read_numbers(t, config.core_ship, CORE_SHIP_FIELDS);
    });
    reader.table("Drone", [&](TableReader& t) {
        read_numbers(t, config.drone, DRONE_FIELDS);
    });
    reader.table("Training", [&](TableReader& t) {
        for (auto& item : config.training_catalog) {
            t.table(item.id.c_str(), [&](TableReader& unit) {
                unit.text("Label", item.label);
                unit.number("Cost", item.cost);
                unit.number("Duration", item.duration);
                if (item.cost < 0) unit.fail("Cost", "non-negative");
                if (item.duration <= 0) unit.fail("Duration", "positive");
            });
        }
    });
    lua_pop(L, 1);

    if (config.max_frame_delta <= 0) reader.fail("MaxFrameDelta", "positive");
    if (config.grid_unit <= 0) reader.fail("GridUnit", "positive");
    if (!reader.ok()) {
        return reader.error();
    }
    spdlog::debug("Applied KufTuning overrides");
    return true;
}

Result<BattleData> BattlefieldLoader::load(const fs::path& data_dir) {
    LuaState state;
    blueprints::BlueprintStore store(state.raw());
    auto ready = prepare(state, store);
    if (!ready) return ready.error();

    auto scripts = run_scripts(state, data_dir);
    if (!scripts) return scripts.error();
    spdlog::info("Ran {} data scripts from {}", scripts.value(),
                 data_dir.string());
    return convert(state, store);
}

Result<BattleData> BattlefieldLoader::load_string(std::string_view script) {
    LuaState state;
    blueprints::BlueprintStore store(state.raw());
    auto ready = prepare(state, store);
    if (!ready) return ready.error();

    auto result = state.do_string(script);
    if (!result) return result.error();
    return convert(state, store);
}

Result<BattleData> BattlefieldLoader::convert(
    LuaState& state, const blueprints::BlueprintStore& store) {
    BattleData data;

    auto tuning = load_tuning(state, data.config);
    if (!tuning) return tuning.error();

    auto enemies = load_enemies(store, data.catalog);
    if (!enemies) return enemies.error();

    auto maps = load_maps(store, data.catalog, data.maps);
    if (!maps) return maps.error();
    if (data.maps.empty()) {
        return Error("No battlefields registered");
    }

    store.log_statistics();
    spdlog::info("Loaded {} battlefields, {} enemy types{}", data.maps.size(),
                 data.catalog.size(), tuning.value() ? ", tuning overrides" : "");
    return data;
}

} // namespace kuf::lua
