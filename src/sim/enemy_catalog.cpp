#include "sim/enemy_catalog.hpp"
#include "sim/sim_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kuf::sim {

namespace {

constexpr f32 TURRET_RADIUS = 2.4f;
constexpr f32 TURRET_RANGE = 200.0f;
constexpr f32 BIG_TURRET_RADIUS = 4.8f;
constexpr f32 BIG_TURRET_RANGE = 250.0f;
constexpr f32 MELEE_RADIUS = 3.2f;
constexpr f32 RANGED_RADIUS = 3.0f;
constexpr f32 BARRACKS_RADIUS = 6.0f;
constexpr f32 MINE_RADIUS = 2.0f;
constexpr f32 WALL_RADIUS = 8.0f;

EnemyArchetype gun(const char* type, const char* name, f32 radius, f32 health,
                   f32 attack, f32 attack_speed, f32 range, f32 gold) {
    EnemyArchetype a;
    a.type = type;
    a.name = name;
    a.radius = radius;
    a.health = health;
    a.attack = attack;
    a.attack_speed = attack_speed;
    a.range = range;
    a.gold_value = gold;
    return a;
}

EnemyArchetype structure(const char* type, const char* name, f32 radius,
                         f32 health, f32 gold) {
    EnemyArchetype a = gun(type, name, radius, health, 0, 0, 0, gold);
    a.is_structure = true;
    return a;
}

EnemyArchetype raider(const char* type, const char* name, f32 radius,
                      f32 health, f32 attack, f32 attack_speed, f32 range,
                      f32 gold, f32 speed, f32 sight) {
    EnemyArchetype a =
        gun(type, name, radius, health, attack, attack_speed, range, gold);
    a.mobile = MobileTraits{speed, sight};
    return a;
}

EnemyArchetype barracks(const char* type, const char* name,
                        const char* spawn_type) {
    EnemyArchetype a = gun(type, name, BARRACKS_RADIUS, 30, 0, 0, 0, 10);
    BarracksTraits traits;
    traits.spawn_type = spawn_type;
    a.barracks = traits;
    return a;
}

} // namespace

EnemyCatalog EnemyCatalog::with_defaults() {
    EnemyCatalog catalog;

    catalog.add(gun("small_turret", "Light Turret", TURRET_RADIUS, 5, 1, 1,
                    TURRET_RANGE, 6));
    catalog.add(gun("big_turret", "Heavy Turret", BIG_TURRET_RADIUS, 20, 3,
                    0.8f, BIG_TURRET_RANGE, 12));
    catalog.add(gun("laser_turret", "Laser Turret", TURRET_RADIUS, 8, 1.8f,
                    1.6f, TURRET_RANGE * 1.1f, 8));
    catalog.add(gun("rocket_turret", "Rocket Turret", BIG_TURRET_RADIUS * 0.9f,
                    16, 2.5f, 1.1f, BIG_TURRET_RANGE * 1.1f, 11));
    catalog.add(gun("artillery_turret", "Artillery Turret", BIG_TURRET_RADIUS,
                    24, 3.5f, 0.7f, BIG_TURRET_RANGE * 1.35f, 14));

    EnemyArchetype plasma = gun("plasma_turret", "Plasma Turret", TURRET_RADIUS,
                                10, 1.4f, 1.4f, TURRET_RANGE * 1.05f, 10);
    plasma.projectile_speed = 260;
    plasma.projectile_effects = EffectPayload{StatusKind::Burn, 2.5f, 4.0f};
    catalog.add(std::move(plasma));

    EnemyArchetype scatter =
        gun("scatter_turret", "Scatter Turret", BIG_TURRET_RADIUS * 0.85f, 18,
            1.8f, 1.3f, BIG_TURRET_RANGE, 13);
    scatter.multi_shot = 3;
    scatter.spread_angle = 18.0f * PI / 180.0f;
    catalog.add(std::move(scatter));

    EnemyArchetype wall = gun("wall", "Bastion Wall", WALL_RADIUS, 50, 0, 0, 0, 4);
    wall.is_wall = true;
    catalog.add(std::move(wall));

    EnemyArchetype mine = gun("mine", "Mine", MINE_RADIUS, 1, 5, 0, 0, 5);
    mine.mine = MineTraits{60.0f, false};
    catalog.add(std::move(mine));

    catalog.add(raider("melee_unit", "Melee Raider", MELEE_RADIUS, 8, 2, 1.2f,
                       20, 7, 60, 150));
    catalog.add(raider("ranged_unit", "Ranged Skirmisher", RANGED_RADIUS, 6,
                       1.5f, 0.8f, 120, 8, 50, 180));

    catalog.add(barracks("melee_barracks", "Melee Barracks", "melee_unit"));
    catalog.add(barracks("ranged_barracks", "Ranged Barracks", "ranged_unit"));

    EnemyArchetype support = raider("support_drone", "Support Drone",
                                    RANGED_RADIUS, 6, 0, 0, 0, 9, 85, 260);
    SupportTraits heal;
    heal.heal_range = 80;
    heal.heal_per_second = 6;
    support.support = heal;
    catalog.add(std::move(support));

    EnemyArchetype obelisk = structure("stasis_obelisk", "Stasis Obelisk",
                                       BIG_TURRET_RADIUS, 28, 11);
    obelisk.stasis_field = StasisFieldTraits{220.0f, 0.35f, 0.0f};
    catalog.add(std::move(obelisk));

    EnemyArchetype pylon = structure("relay_pylon", "Relay Pylon",
                                     BIG_TURRET_RADIUS * 0.75f, 30, 12);
    pylon.buff_node = BuffNodeTraits{240.0f, 1.25f, 1.15f};
    catalog.add(std::move(pylon));

    catalog.add(structure("shield_generator", "Shield Generator",
                          BIG_TURRET_RADIUS, 40, 9));
    catalog.add(structure("supply_cache", "Supply Cache",
                          BIG_TURRET_RADIUS * 0.8f, 35, 12));
    catalog.add(structure("signal_beacon", "Signal Beacon",
                          BIG_TURRET_RADIUS * 0.7f, 28, 10));

    return catalog;
}

void EnemyCatalog::add(EnemyArchetype archetype) {
    auto it = index_.find(archetype.type);
    if (it != index_.end()) {
        archetypes_[it->second] = std::move(archetype);
        return;
    }
    index_[archetype.type] = archetypes_.size();
    archetypes_.push_back(std::move(archetype));
}

const EnemyArchetype* EnemyCatalog::find(const std::string& type) const {
    auto it = index_.find(type);
    return it != index_.end() ? &archetypes_[it->second] : nullptr;
}

std::unique_ptr<Turret> make_enemy(const EnemyArchetype& archetype,
                                   const Vector2& position, u32 level) {
    level = std::max(1u, level);
    auto t = std::make_unique<Turret>();
    t->type = archetype.type;
    t->set_position(position);
    t->set_radius(archetype.radius);
    t->set_max_health(archetype.health * static_cast<f32>(level));
    t->set_health(t->max_health());
    t->attack = archetype.attack * static_cast<f32>(level);
    t->attack_speed = archetype.attack_speed;
    t->range = archetype.range;
    t->level = level;
    t->gold_value = archetype.gold_value;

    t->projectile_speed = archetype.projectile_speed;
    t->multi_shot = std::max(1u, archetype.multi_shot);
    t->spread_angle = archetype.spread_angle;
    t->projectile_effects = archetype.projectile_effects;

    t->is_wall = archetype.is_wall;
    t->is_structure = archetype.is_structure;
    t->mine = archetype.mine;
    t->barracks = archetype.barracks;
    t->support = archetype.support;
    t->mobile = archetype.mobile;
    t->stasis_field = archetype.stasis_field;
    t->buff_node = archetype.buff_node;
    return t;
}

Turret* create_enemy(SimContext& ctx, const std::string& type,
                     const Vector2& position, u32 level) {
    const EnemyArchetype* archetype = ctx.catalog.find(type);
    if (!archetype) {
        spdlog::warn("Unknown enemy type: {}", type);
        return nullptr;
    }
    Turret& t = ctx.store.add_turret(make_enemy(*archetype, position, level));
    spdlog::debug("Spawned {} #{} (level {}) at ({:.1f}, {:.1f})", type,
                  t.entity_id(), t.level, position.x, position.y);
    return &t;
}

} // namespace kuf::sim
