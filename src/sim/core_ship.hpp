#pragma once

#include "sim/entity.hpp"

namespace kuf::sim {

struct SimContext;
struct SimConfig;

/// Derived core ship loadout, precomputed by the meta-progression layer.
/// Upgrade fields are counts of allocated shards.
struct CoreShipStats {
    f32 health = 120;
    u32 cannons = 0;
    f32 hull_repair = 0;   // HP per second
    f32 healing_aura = 0;  // HP per second to nearby marines
    u32 shield = 0;
    u32 drone_rate = 0;
    u32 drone_health = 0;
    u32 drone_damage = 0;
    u32 level = 1;
    f32 scale = 1.0f;
};

/// The HUD-anchored player base. Owns hull repair, healing aura, the
/// shield state machine, drone launches and the cannon battery.
class CoreShip : public Entity {
public:
    bool is_core_ship() const override { return true; }

    u32 cannons = 0;
    f32 cannon_cooldown = 0;

    f32 hull_repair = 0;
    f32 hull_repair_cooldown = 0;

    f32 healing_aura = 0;
    f32 healing_aura_radius = 150.0f;
    f32 healing_aura_cooldown = 0;

    f32 shield = 0;
    f32 max_shield = 0;
    f32 shield_regen_rate = 0;
    f32 shield_regen_delay = 3.0f;
    f32 shield_regen_timer = 0;  // seconds since last hit or break
    bool shield_broken = false;

    f32 drone_spawn_rate = 0;    // seconds between launches, 0 = none
    f32 drone_spawn_timer = 0;
    f32 drone_health = 10;
    f32 drone_damage = 1;

    u32 level = 1;
    f32 scale = 1.0f;

    /// Per-tick subsystem update. Runs in order: anchor, hull repair,
    /// healing aura, shield, drone launch, cannons.
    void update(f64 dt, SimContext& ctx);

    /// Route incoming damage through the shield. A hit on an intact shield
    /// drains it; draining to zero breaks it. Otherwise the hull takes the
    /// damage. Every hit restarts the regen delay.
    void absorb_hit(f32 damage);

private:
    void update_hull_repair(f64 dt, const SimConfig& config);
    void update_healing_aura(f64 dt, SimContext& ctx);
    void update_shield(f64 dt);
    void update_drone_launch(f64 dt, SimContext& ctx);
    void update_cannons(f64 dt, SimContext& ctx);
};

/// Build the core ship from its derived stats, docked at `anchor`.
CoreShip make_core_ship(const CoreShipStats& stats, const Vector2& anchor,
                        const SimConfig& config);

} // namespace kuf::sim
