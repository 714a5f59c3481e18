#include "sim/structures.hpp"
#include "sim/movement.hpp"
#include "sim/sim_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

void update_barracks(Turret& barracks, SimContext& ctx, f64 dt) {
    if (!barracks.barracks) return;
    BarracksTraits& b = *barracks.barracks;

    b.spawn_timer = std::max(0.0f, b.spawn_timer - static_cast<f32>(dt));
    if (b.spawn_timer > 0 || b.current_spawns >= b.max_spawns) return;

    // A damaged barracks answers any attacker; otherwise it waits for a
    // player target inside its spawn range.
    f32 reach = barracks.damaged() ? INFINITE_RANGE : b.spawn_range;
    if (!find_closest_player_target(ctx.store, barracks.position(), reach))
        return;

    f32 angle = ctx.random() * TWO_PI;
    f32 dist = barracks.radius() + ctx.config.barracks_spawn_offset;
    Vector2 at{barracks.x() + std::cos(angle) * dist,
               barracks.y() + std::sin(angle) * dist};
    b.current_spawns++;
    b.spawn_timer = b.spawn_cooldown;
    create_enemy(ctx, b.spawn_type, at, barracks.level);
}

void update_support(Turret& support, SimContext& ctx, f64 dt) {
    if (!support.support) return;
    SupportTraits& s = *support.support;
    f32 sight = support.mobile ? support.mobile->sight_range : 0.0f;
    f32 speed = support.mobile ? support.mobile->move_speed : 0.0f;

    Turret* target = find_damaged_turret(ctx.store, support.position(), sight,
                                         support.entity_id());
    if (!target) return;

    f32 dist = distance(support.position(), target->position());
    if (dist > s.heal_range) {
        move_directly_toward(support, target->position(), speed, dt);
        s.heal_target_id = 0;
        s.active_heal_target.reset();
    } else {
        target->heal(s.heal_per_second * static_cast<f32>(dt));
        s.heal_visual_timer = ctx.config.support_heal_visual;
        s.heal_target_id = target->entity_id();
        s.active_heal_target = target->position();
    }
}

void detonate_mine(Turret& mine, SimContext& ctx) {
    if (!mine.mine || mine.mine->detonated) return;
    mine.mine->detonated = true;

    f32 radius = mine.mine->explosion_radius > 0
                     ? mine.mine->explosion_radius
                     : ctx.config.mine_explosion_radius;
    f32 r2 = radius * radius;
    f32 damage = mine.attack * static_cast<f32>(mine.level);

    for (const auto& m : ctx.store.marines()) {
        if (distance_squared(m->position(), mine.position()) <= r2)
            m->apply_damage(damage);
    }
    for (const auto& t : ctx.store.turrets()) {
        if (t.get() == &mine) continue;
        if (distance_squared(t->position(), mine.position()) <= r2)
            t->apply_damage(damage);
    }

    Explosion blast;
    blast.position = mine.position();
    blast.max_radius = radius;
    blast.life = ctx.config.explosion_life;
    blast.max_life = ctx.config.explosion_life;
    ctx.store.add_explosion(blast);
    spdlog::debug("Mine #{} detonated for {:.1f} damage (radius {:.0f})",
                  mine.entity_id(), damage, radius);
}

size_t reap_destroyed_turrets(SimContext& ctx) {
    // Detonations can kill further mines; repeat until the chain settles
    bool detonated = true;
    while (detonated) {
        detonated = false;
        for (const auto& t : ctx.store.turrets()) {
            if (t->alive() || !t->is_mine() || t->mine->detonated) continue;
            detonate_mine(*t, ctx);
            detonated = true;
        }
    }
    return ctx.store.remove_turrets_if(
        [](const Turret& t) { return !t.alive(); });
}

void update_explosions(EntityStore& store, f64 dt) {
    auto& explosions = store.explosions();
    for (auto& e : explosions) {
        e.life = std::max(0.0f, e.life - static_cast<f32>(dt));
        f32 progress = e.max_life > 0 ? 1.0f - e.life / e.max_life : 1.0f;
        e.radius = e.max_radius * std::clamp(progress, 0.0f, 1.0f);
    }
    explosions.erase(std::remove_if(explosions.begin(), explosions.end(),
                                    [](const Explosion& e) { return e.life <= 0; }),
                     explosions.end());
}

} // namespace kuf::sim
