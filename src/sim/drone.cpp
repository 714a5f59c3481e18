#include "sim/drone.hpp"
#include "sim/movement.hpp"
#include "sim/projectile.hpp"
#include "sim/sim_state.hpp"

#include <algorithm>

namespace kuf::sim {

void Drone::update(f64 dt, SimContext& ctx) {
    cooldown = std::max(0.0f, cooldown - static_cast<f32>(dt));

    Turret* target = find_closest_turret(ctx.store, ctx.targeting, position(),
                                         INFINITE_RANGE);
    if (!target) return;

    if (distance(position(), target->position()) > range) {
        move_directly_toward(*this, target->position(), move_speed, dt);
        return;
    }
    if (cooldown > 0) return;

    ProjectileSpec shot;
    shot.owner = ProjectileOwner::Marine;
    shot.type = "drone";
    shot.origin = position();
    shot.target_position = target->position();
    shot.target_id = target->entity_id();
    shot.speed = ctx.config.marine.bullet_speed;
    shot.damage = attack;
    spawn_projectile(ctx, shot);
    cooldown = 1.0f / std::max(0.1f, attack_speed);
}

} // namespace kuf::sim
