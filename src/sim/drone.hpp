#pragma once

#include "sim/entity.hpp"

namespace kuf::sim {

struct SimContext;

/// Autonomous escort launched by the core ship.
class Drone : public Entity {
public:
    bool is_drone() const override { return true; }

    Vector2 velocity;
    f32 attack = 0;
    f32 attack_speed = 1.5f;
    f32 cooldown = 0;
    f32 move_speed = 80.0f;
    f32 range = 120.0f;

    /// Per-tick: close on the nearest turret and fire when in range.
    void update(f64 dt, SimContext& ctx);
};

} // namespace kuf::sim
