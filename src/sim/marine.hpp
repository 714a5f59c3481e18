#pragma once

#include "sim/entity.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace kuf::sim {

enum class MarineType {
    Marine,
    Sniper,
    Splayer,
    Laser,
    Worker,
    DroneSupport,
};

const char* marine_type_name(MarineType type);
std::optional<MarineType> parse_marine_type(std::string_view name);

enum class StatusKind {
    Burn,  // magnitude = damage per second
    Slow,  // magnitude = move speed multiplier
};

struct StatusEffect {
    StatusKind kind = StatusKind::Burn;
    f32 remaining = 0;
    f32 magnitude = 0;
};

/// Status effect carried by a projectile and applied on impact.
struct EffectPayload {
    StatusKind kind = StatusKind::Burn;
    f32 magnitude = 0;
    f32 duration = 0;
};

/// Player-controlled combat unit.
class Marine : public Entity {
public:
    bool is_marine() const override { return true; }

    MarineType type = MarineType::Marine;
    Vector2 velocity;
    f32 base_move_speed = 0;
    f32 move_speed = 0;
    f32 attack = 0;
    f32 attack_speed = 1;     // shots per second
    f32 cooldown = 0;         // seconds until can fire again
    f32 range = 0;
    std::vector<StatusEffect> status_effects;
    std::optional<Vector2> waypoint;

    // Splayer hull spin
    f32 rotation = 0;
    f32 rotation_speed = 0;
    f32 rotation_boost_timer = 0;
};

} // namespace kuf::sim
