#include "sim/weapon.hpp"
#include "sim/aura.hpp"
#include "sim/movement.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

namespace {

constexpr f32 MIN_TURRET_ATTACK_SPEED = 0.1f;

void fire_marine(Marine& marine, const Turret& target, SimContext& ctx) {
    const SimConfig& config = ctx.config;
    ProjectileSpec shot;
    shot.owner = ProjectileOwner::Marine;
    shot.type = marine_type_name(marine.type);
    shot.origin = {marine.x(), marine.y() - marine.radius()};
    shot.target_position = target.position();
    shot.target_id = target.entity_id();
    shot.damage = marine.attack;

    switch (marine.type) {
    case MarineType::Splayer:
        // Ring of homing rockets, each launched on its own random heading
        shot.speed = config.splayer.bullet_speed;
        shot.damage = marine.attack * config.splayer_rocket_damage_scale;
        shot.homing = true;
        for (u32 i = 0; i < config.splayer_rocket_count; i++) {
            shot.angle = ctx.random() * TWO_PI;
            spawn_projectile(ctx, shot);
        }
        marine.rotation_boost_timer = config.splayer_spin_boost_duration;
        break;
    case MarineType::Laser:
        shot.speed = config.laser.bullet_speed;
        shot.pierce = config.laser_pierce_count;
        spawn_projectile(ctx, shot);
        break;
    default:
        shot.speed = marine.type == MarineType::Sniper
                         ? config.sniper.bullet_speed
                         : config.marine.bullet_speed;
        spawn_projectile(ctx, shot);
        break;
    }
}

} // namespace

void update_splayer_spin(Marine& marine, const SimConfig& config, f64 dt) {
    if (marine.type != MarineType::Splayer) return;
    f32 step = static_cast<f32>(dt);
    f32 boost = marine.rotation_boost_timer > 0
                    ? config.splayer_spin_boost_multiplier
                    : 1.0f;
    marine.rotation_boost_timer = std::max(0.0f, marine.rotation_boost_timer - step);
    marine.rotation =
        std::fmod(marine.rotation + marine.rotation_speed * boost * step, TWO_PI);
}

void update_marine_weapon(Marine& marine, const Turret* focused,
                          SimContext& ctx, f64 dt) {
    marine.cooldown = std::max(0.0f, marine.cooldown - static_cast<f32>(dt));

    const Turret* target = nullptr;
    if (focused) {
        // A focused enemy out of range holds fire rather than falling back
        if (distance_squared(marine.position(), focused->position()) <=
            marine.range * marine.range)
            target = focused;
    } else {
        target = find_closest_turret(ctx.store, ctx.targeting,
                                     marine.position(), marine.range);
    }

    if (!target || marine.cooldown > 0) return;
    fire_marine(marine, *target, ctx);
    marine.cooldown = 1.0f / marine.attack_speed;
}

void fire_turret(Turret& turret, const Entity& target, SimContext& ctx) {
    AttackModifier mod = get_turret_attack_modifier(ctx.store, turret);
    f32 speed = turret.projectile_speed > 0 ? turret.projectile_speed
                                            : ctx.config.turret_bullet_speed;
    f32 attack_speed = std::max(MIN_TURRET_ATTACK_SPEED,
                                turret.attack_speed * mod.attack_speed_multiplier);
    u32 shots = std::max(1u, turret.multi_shot);
    f32 base_angle =
        std::atan2(target.y() - turret.y(), target.x() - turret.x());

    ProjectileSpec shot;
    shot.owner = ProjectileOwner::Turret;
    shot.type = turret.type;
    shot.origin = {turret.x(), turret.y() + turret.radius()};
    shot.target_position = target.position();
    shot.target_id = target.entity_id();
    shot.speed = speed;
    shot.damage = turret.attack * mod.damage_multiplier;
    shot.effects = turret.projectile_effects;

    for (u32 i = 0; i < shots; i++) {
        f32 lerp = shots > 1 ? static_cast<f32>(i) / static_cast<f32>(shots - 1) - 0.5f
                             : 0.0f;
        shot.angle = base_angle + turret.spread_angle * lerp;
        spawn_projectile(ctx, shot);
    }

    turret.cooldown = 1.0f / attack_speed;
    spdlog::debug("{} #{} fired {} round(s) at #{}", turret.type,
                  turret.entity_id(), shots, target.entity_id());
}

void update_turret_weapon(Turret& turret, SimContext& ctx) {
    if (turret.attack <= 0 || turret.is_wall || turret.is_mine()) return;
    Entity* target =
        find_closest_player_target(ctx.store, turret.position(), turret.range);
    if (target && turret.cooldown <= 0)
        fire_turret(turret, *target, ctx);
}

void update_mobile_turret(Turret& turret, SimContext& ctx, f64 dt) {
    if (!turret.mobile) return;
    Entity* target =
        find_closest_player_target(ctx.store, turret.position(), INFINITE_RANGE);
    if (!target) return;

    f32 dist = distance(turret.position(), target->position());
    if (dist > turret.range) {
        move_directly_toward(turret, target->position(), turret.mobile->move_speed,
                             dt);
    } else if (turret.cooldown <= 0 && turret.attack > 0) {
        fire_turret(turret, *target, ctx);
    }
}

} // namespace kuf::sim
