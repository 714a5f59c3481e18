#pragma once

#include "sim/entity.hpp" // Vector2

namespace kuf::sim {

class Marine;
class Turret;
struct SimConfig;

/// Accelerate `velocity` per axis toward the heading to `target` at
/// `move_speed`. Within `arrival_tolerance` the velocity is zeroed and
/// true is returned.
bool steer_toward(Vector2& velocity, const Vector2& position,
                  const Vector2& target, f32 move_speed, f32 acceleration,
                  f32 arrival_tolerance, f64 dt);

/// Step each axis of `velocity` toward zero by `acceleration * dt`.
void decelerate(Vector2& velocity, f32 acceleration, f64 dt);

/// Forward advance: accelerate toward -y at `move_speed`, decay x to zero.
void advance(Vector2& velocity, f32 move_speed, f32 acceleration, f64 dt);

/// Constant-speed approach without inertia. Returns the distance to
/// `target` measured before moving.
f32 move_directly_toward(Entity& entity, const Vector2& target, f32 speed,
                         f64 dt);

/// True while a waypoint is set and either axis is more than the arrival
/// tolerance away from it.
bool has_pending_waypoint(const Marine& marine, f32 arrival_tolerance);

/// Run the marine's movement state (focused hold, attack-move, advance)
/// and integrate its position.
void update_marine_movement(Marine& marine, const Turret* focused,
                            const SimConfig& config, f64 dt);

} // namespace kuf::sim
