#include "sim/projectile.hpp"
#include "sim/sim_state.hpp"
#include "sim/status_effects.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

namespace {

// First entity of `pool` (id order) whose radius contains `p` and that the
// projectile has not already struck.
template <typename T>
T* find_hit(const std::vector<std::unique_ptr<T>>& pool, const Projectile& p) {
    for (const auto& e : pool) {
        if (p.has_hit(e->entity_id())) continue;
        f32 r = e->radius();
        if (distance_squared(p.position(), e->position()) <= r * r)
            return e.get();
    }
    return nullptr;
}

f32 wrap_angle(f32 a) {
    while (a > PI) a -= TWO_PI;
    while (a < -PI) a += TWO_PI;
    return a;
}

} // namespace

void Projectile::update(f64 dt, SimContext& ctx) {
    if (life <= 0) return;
    f32 step = static_cast<f32>(dt);

    if (homing) steer_toward_target(dt, ctx);

    set_position({x() + velocity.x * step, y() + velocity.y * step});
    life = std::max(0.0f, life - step);

    if (player_owned())
        resolve_player_hit(ctx);
    else
        resolve_enemy_hit(ctx);
}

void Projectile::steer_toward_target(f64 dt, SimContext& ctx) {
    if (target_entity_id == 0) return;
    // Dead or removed targets leave the round on its last heading
    Entity* target = ctx.store.find(target_entity_id);
    if (!target || !target->alive()) return;

    f32 desired = std::atan2(target->y() - y(), target->x() - x());
    f32 current = std::atan2(velocity.y, velocity.x);
    f32 diff = wrap_angle(desired - current);
    f32 max_turn = ctx.config.homing_turn_rate * static_cast<f32>(dt);
    f32 turn = std::copysign(std::min(std::abs(diff), max_turn), diff);
    f32 heading = current + turn;
    velocity = {std::cos(heading) * speed, std::sin(heading) * speed};
}

void Projectile::register_hit(u32 target_id) {
    if (hit_targets) hit_targets->insert(target_id);
    if (pierce > 0) {
        pierce--;
        if (pierce == 0) life = 0;
    } else {
        life = 0;
    }
}

void Projectile::resolve_player_hit(SimContext& ctx) {
    Turret* hit = find_hit(ctx.store.turrets(), *this);
    if (!hit || !hit->alive()) return;

    hit->apply_damage(damage);
    register_hit(hit->entity_id());
    if (!hit->alive()) {
        ctx.economy.award_kill(hit->gold_value);
        spdlog::debug("{} #{} destroyed by {} round", hit->type,
                      hit->entity_id(), type);
    }
}

void Projectile::resolve_enemy_hit(SimContext& ctx) {
    if (Marine* m = find_hit(ctx.store.marines(), *this); m && m->alive()) {
        m->apply_damage(damage);
        if (effects) apply_effect(*m, *effects, ctx.config);
        life = 0;
        return;
    }
    if (Drone* d = find_hit(ctx.store.drones(), *this); d && d->alive()) {
        d->apply_damage(damage);
        life = 0;
        return;
    }
    CoreShip* ship = ctx.store.core_ship();
    if (ship && ship->alive()) {
        f32 r = ship->radius();
        if (distance_squared(position(), ship->position()) <= r * r) {
            ship->absorb_hit(damage);
            life = 0;
        }
    }
}

Projectile& spawn_projectile(SimContext& ctx, const ProjectileSpec& shot) {
    f32 heading = shot.angle ? *shot.angle
                             : std::atan2(shot.target_position.y - shot.origin.y,
                                          shot.target_position.x - shot.origin.x);

    auto p = std::make_unique<Projectile>();
    p->owner = shot.owner;
    p->type = shot.type.empty() ? "marine" : shot.type;
    p->set_position(shot.origin);
    p->velocity = {std::cos(heading) * shot.speed, std::sin(heading) * shot.speed};
    p->speed = shot.speed;
    p->damage = shot.damage;
    p->life = ctx.config.bullet_life;
    p->homing = shot.homing;
    p->target_entity_id = shot.homing ? shot.target_id : 0;
    p->effects = shot.effects;
    p->pierce = shot.pierce;
    if (shot.pierce > 0) p->hit_targets.emplace();
    return ctx.store.add_projectile(std::move(p));
}

bool within_cull_bounds(const Vector2& p, const SimContext& ctx) {
    f32 margin = ctx.config.bullet_culling_margin;
    f32 zoom = ctx.camera.zoom > 0 ? ctx.camera.zoom : 1.0f;
    f32 left = ctx.camera.x - margin;
    f32 right = ctx.camera.x + ctx.view.width / zoom + margin;
    f32 top = ctx.camera.y - margin;
    f32 bottom = ctx.camera.y + ctx.view.height / zoom + margin;
    return p.x > left && p.x < right && p.y > top && p.y < bottom;
}

void update_projectiles(f64 dt, SimContext& ctx) {
    for (const auto& p : ctx.store.projectiles())
        p->update(dt, ctx);

    ctx.store.remove_projectiles_if([&](const Projectile& p) {
        return p.life <= 0 || !within_cull_bounds(p.position(), ctx);
    });
}

} // namespace kuf::sim
