#pragma once

#include "sim/entity.hpp"
#include "sim/marine.hpp" // EffectPayload

#include <optional>
#include <string>
#include <unordered_set>

namespace kuf::sim {

struct SimContext;

enum class ProjectileOwner {
    Marine,
    Turret,
    CoreShip,
};

class Projectile : public Entity {
public:
    bool is_projectile() const override { return true; }

    ProjectileOwner owner = ProjectileOwner::Marine;
    std::string type = "marine";
    Vector2 velocity;
    f32 speed = 0;
    f32 damage = 0;
    f32 life = 2.5f;              // seconds remaining
    bool homing = false;
    u32 target_entity_id = 0;     // homing target, 0 = none
    u32 pierce = 0;               // remaining extra hits
    std::optional<std::unordered_set<u32>> hit_targets; // only when piercing
    std::optional<EffectPayload> effects;

    bool player_owned() const { return owner != ProjectileOwner::Turret; }
    bool has_hit(u32 id) const {
        return hit_targets && hit_targets->count(id) > 0;
    }

    /// Per-tick: steer, move, age, and resolve collisions.
    void update(f64 dt, SimContext& ctx);

private:
    void steer_toward_target(f64 dt, SimContext& ctx);
    void resolve_player_hit(SimContext& ctx);
    void resolve_enemy_hit(SimContext& ctx);
    void register_hit(u32 target_id);
};

/// Launch parameters. With no `angle`, the round heads straight for
/// `target_position`.
struct ProjectileSpec {
    ProjectileOwner owner = ProjectileOwner::Marine;
    std::string type;
    Vector2 origin;
    Vector2 target_position;
    u32 target_id = 0;
    f32 speed = 0;
    f32 damage = 0;
    bool homing = false;
    std::optional<f32> angle;
    std::optional<EffectPayload> effects;
    u32 pierce = 0;
};

Projectile& spawn_projectile(SimContext& ctx, const ProjectileSpec& shot);

/// Advance every projectile, then cull spent or out-of-view rounds.
void update_projectiles(f64 dt, SimContext& ctx);

/// True while `p` lies inside the camera view grown by the culling margin.
bool within_cull_bounds(const Vector2& p, const SimContext& ctx);

} // namespace kuf::sim
