#include "sim/movement.hpp"
#include "sim/marine.hpp"
#include "sim/sim_config.hpp"
#include "sim/turret.hpp"

#include <algorithm>
#include <cmath>

namespace kuf::sim {

namespace {

// Move `v` toward `target` by at most `step`.
f32 approach(f32 v, f32 target, f32 step) {
    if (v < target) return std::min(target, v + step);
    if (v > target) return std::max(target, v - step);
    return v;
}

// Move `v` toward zero by `step`, snapping once within reach.
f32 decay(f32 v, f32 step) {
    if (std::abs(v) > step) return v > 0 ? v - step : v + step;
    return 0;
}

} // namespace

bool steer_toward(Vector2& velocity, const Vector2& position,
                  const Vector2& target, f32 move_speed, f32 acceleration,
                  f32 arrival_tolerance, f64 dt) {
    f32 dx = target.x - position.x;
    f32 dy = target.y - position.y;
    f32 dist = std::sqrt(dx * dx + dy * dy);
    if (dist <= arrival_tolerance) {
        velocity = {};
        return true;
    }
    f32 step = acceleration * static_cast<f32>(dt);
    velocity.x = approach(velocity.x, dx / dist * move_speed, step);
    velocity.y = approach(velocity.y, dy / dist * move_speed, step);
    return false;
}

void decelerate(Vector2& velocity, f32 acceleration, f64 dt) {
    f32 step = acceleration * static_cast<f32>(dt);
    velocity.y = decay(velocity.y, step);
    velocity.x = decay(velocity.x, step);
}

void advance(Vector2& velocity, f32 move_speed, f32 acceleration, f64 dt) {
    f32 step = acceleration * static_cast<f32>(dt);
    velocity.y = approach(velocity.y, -move_speed, step);
    velocity.x = decay(velocity.x, step);
}

f32 move_directly_toward(Entity& entity, const Vector2& target, f32 speed,
                         f64 dt) {
    f32 dx = target.x - entity.x();
    f32 dy = target.y - entity.y();
    f32 dist = std::sqrt(dx * dx + dy * dy);
    if (dist <= 0) return 0;
    f32 step = speed * static_cast<f32>(dt);
    entity.set_position({entity.x() + dx / dist * step,
                         entity.y() + dy / dist * step});
    return dist;
}

bool has_pending_waypoint(const Marine& marine, f32 arrival_tolerance) {
    if (!marine.waypoint) return false;
    return std::abs(marine.x() - marine.waypoint->x) > arrival_tolerance ||
           std::abs(marine.y() - marine.waypoint->y) > arrival_tolerance;
}

void update_marine_movement(Marine& marine, const Turret* focused,
                            const SimConfig& config, f64 dt) {
    bool pending = has_pending_waypoint(marine, config.arrival_tolerance);
    if (marine.waypoint && !pending) marine.waypoint.reset(); // arrived

    if (focused && !pending) {
        // Hold at the edge of firing range from the focused enemy
        f32 dx = focused->x() - marine.x();
        f32 dy = focused->y() - marine.y();
        f32 dist = std::sqrt(dx * dx + dy * dy);
        if (dist <= 0) dist = 1;
        f32 desired = std::max(0.0f, marine.range - config.target_hold_buffer);
        if (std::abs(dist - desired) > config.target_hold_buffer) {
            Vector2 stand_off{focused->x() - dx / dist * desired,
                              focused->y() - dy / dist * desired};
            steer_toward(marine.velocity, marine.position(), stand_off,
                         marine.move_speed, config.unit_acceleration,
                         config.arrival_tolerance, dt);
        } else {
            decelerate(marine.velocity, config.unit_acceleration, dt);
        }
    } else if (pending) {
        if (steer_toward(marine.velocity, marine.position(), *marine.waypoint,
                         marine.move_speed, config.unit_acceleration,
                         config.arrival_tolerance, dt))
            marine.waypoint.reset();
    } else {
        advance(marine.velocity, marine.move_speed, config.unit_acceleration,
                dt);
    }

    f32 step = static_cast<f32>(dt);
    marine.set_position({marine.x() + marine.velocity.x * step,
                         marine.y() + marine.velocity.y * step});
}

} // namespace kuf::sim
