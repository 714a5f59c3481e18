#include "sim/core_ship.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

void CoreShip::update(f64 dt, SimContext& ctx) {
    // Stay docked to the HUD base even as the camera pans
    set_position(ctx.base_anchor);

    update_hull_repair(dt, ctx.config);
    update_healing_aura(dt, ctx);
    update_shield(dt);
    update_drone_launch(dt, ctx);
    update_cannons(dt, ctx);
}

void CoreShip::absorb_hit(f32 damage) {
    if (shield > 0 && !shield_broken) {
        shield -= damage;
        if (shield <= 0) {
            shield = 0;
            shield_broken = true;
            spdlog::debug("Core ship shield broken");
        }
    } else {
        apply_damage(damage);
    }
    shield_regen_timer = 0;
}

void CoreShip::update_hull_repair(f64 dt, const SimConfig& config) {
    if (hull_repair <= 0 || !damaged()) return;
    f32 step = static_cast<f32>(dt);
    hull_repair_cooldown = std::max(0.0f, hull_repair_cooldown - step);
    if (hull_repair_cooldown > 0) return;
    heal(hull_repair * step);
    hull_repair_cooldown = config.core_ship.repair_interval;
}

void CoreShip::update_healing_aura(f64 dt, SimContext& ctx) {
    if (healing_aura <= 0) return;
    f32 interval = ctx.config.core_ship.repair_interval;
    healing_aura_cooldown =
        std::max(0.0f, healing_aura_cooldown - static_cast<f32>(dt));
    if (healing_aura_cooldown > 0) return;

    f32 amount = healing_aura * interval;
    f32 r2 = healing_aura_radius * healing_aura_radius;
    for (const auto& m : ctx.store.marines()) {
        if (distance_squared(m->position(), position()) <= r2 &&
            m->alive() && m->damaged())
            m->heal(amount);
    }
    healing_aura_cooldown = interval;
}

void CoreShip::update_shield(f64 dt) {
    if (max_shield <= 0) return;
    if (!shield_broken && shield >= max_shield) return;

    // Broken or damaged: nothing regenerates until the delay has passed
    // without a new hit
    shield_regen_timer += static_cast<f32>(dt);
    if (shield_regen_timer < shield_regen_delay) return;

    shield = std::min(max_shield,
                      shield + shield_regen_rate * static_cast<f32>(dt));
    if (shield >= max_shield) {
        shield = max_shield;
        if (shield_broken) spdlog::debug("Core ship shield restored");
        shield_broken = false;
    }
}

void CoreShip::update_drone_launch(f64 dt, SimContext& ctx) {
    if (drone_spawn_rate <= 0) return;
    drone_spawn_timer += static_cast<f32>(dt);
    if (drone_spawn_timer < drone_spawn_rate) return;
    drone_spawn_timer = 0;

    const DroneConfig& cfg = ctx.config.drone;
    f32 angle = ctx.random() * TWO_PI;
    f32 dist = radius() + ctx.config.core_ship.drone_spawn_offset;

    auto drone = std::make_unique<Drone>();
    drone->set_position({x() + std::cos(angle) * dist,
                         y() + std::sin(angle) * dist});
    drone->set_radius(cfg.radius);
    drone->set_max_health(drone_health);
    drone->set_health(drone_health);
    drone->attack = drone_damage;
    drone->attack_speed = cfg.attack_speed;
    drone->move_speed = cfg.move_speed;
    drone->range = cfg.range;
    Drone& d = ctx.store.add_drone(std::move(drone));
    spdlog::debug("Core ship launched drone #{}", d.entity_id());
}

void CoreShip::update_cannons(f64 dt, SimContext& ctx) {
    if (!alive() || cannons == 0) return;
    cannon_cooldown = std::max(0.0f, cannon_cooldown - static_cast<f32>(dt));
    if (cannon_cooldown > 0) return;

    const CoreShipCombatConfig& combat = ctx.config.core_ship;
    Turret* target = find_closest_turret(ctx.store, ctx.targeting, position(),
                                         combat.cannon_range);
    if (!target) return;

    f32 bearing = std::atan2(target->y() - y(), target->x() - x());
    ProjectileSpec shot;
    shot.owner = ProjectileOwner::CoreShip;
    shot.type = "coreShip";
    shot.origin = position();
    shot.target_position = target->position();
    shot.target_id = target->entity_id();
    shot.speed = combat.cannon_projectile_speed;
    shot.damage = combat.cannon_damage;
    for (u32 i = 0; i < cannons; i++) {
        f32 lerp = cannons > 1
                       ? static_cast<f32>(i) / static_cast<f32>(cannons - 1) - 0.5f
                       : 0.0f;
        shot.angle = bearing + combat.cannon_spread * lerp;
        spawn_projectile(ctx, shot);
    }
    cannon_cooldown = 1.0f / std::max(0.1f, combat.cannon_attack_speed);
}

CoreShip make_core_ship(const CoreShipStats& stats, const Vector2& anchor,
                        const SimConfig& config) {
    const CoreShipCombatConfig& combat = config.core_ship;
    CoreShip ship;
    f32 scale = stats.scale > 0 ? stats.scale : 1.0f;
    ship.set_position(anchor);
    ship.set_radius(combat.base_radius * combat.collision_scale * scale);
    f32 health = std::max(1.0f, stats.health);
    ship.set_max_health(health);
    ship.set_health(health);

    ship.cannons = stats.cannons;
    ship.hull_repair = std::max(0.0f, stats.hull_repair);
    ship.healing_aura = std::max(0.0f, stats.healing_aura);
    ship.healing_aura_radius = combat.healing_aura_radius;

    if (stats.shield > 0) {
        ship.max_shield = static_cast<f32>(stats.shield) * combat.shield_per_upgrade;
        ship.shield_regen_rate = combat.shield_regen_base +
                                 static_cast<f32>(stats.shield) *
                                     combat.shield_regen_per_upgrade;
    }
    ship.shield = 0;
    ship.shield_regen_delay = combat.shield_regen_delay;

    if (stats.drone_rate > 0)
        ship.drone_spawn_rate =
            std::max(0.5f, 5.0f - static_cast<f32>(stats.drone_rate) * 0.5f);
    ship.drone_health = 10.0f + static_cast<f32>(stats.drone_health) * 5.0f;
    ship.drone_damage = 1.0f + static_cast<f32>(stats.drone_damage) * 0.5f;

    ship.level = std::max(1u, stats.level);
    ship.scale = scale;
    return ship;
}

} // namespace kuf::sim
