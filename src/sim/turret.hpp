#pragma once

#include "sim/entity.hpp"
#include "sim/marine.hpp" // EffectPayload

#include <optional>
#include <string>

namespace kuf::sim {

struct MineTraits {
    f32 explosion_radius = 60.0f;
    bool detonated = false;
};

struct BarracksTraits {
    std::string spawn_type;
    f32 spawn_range = 150.0f;
    f32 spawn_cooldown = 5.0f;
    f32 spawn_timer = 0;
    u32 max_spawns = 3;
    u32 current_spawns = 0;
};

struct SupportTraits {
    f32 heal_range = 80.0f;
    f32 heal_per_second = 4.0f;
    f32 heal_visual_timer = 0;
    u32 heal_target_id = 0;                 // 0 = not healing
    std::optional<Vector2> active_heal_target; // snapshot for presentation
};

struct MobileTraits {
    f32 move_speed = 0;
    f32 sight_range = 0;
};

struct StasisFieldTraits {
    f32 slow_radius = 0;
    f32 slow_amount = 0.3f;
    f32 field_pulse = 0;
};

struct BuffNodeTraits {
    f32 buff_radius = 0;
    f32 attack_speed_multiplier = 1.0f;
    f32 damage_multiplier = 1.0f;
};

/// Any enemy-side entity: emplacement, raider, structure or barracks.
/// Capabilities are present when the matching trait is set.
class Turret : public Entity {
public:
    bool is_turret() const override { return true; }

    std::string type;         // catalog id, e.g. "small_turret"
    f32 attack = 0;
    f32 attack_speed = 0;
    f32 cooldown = 0;
    f32 range = 0;
    u32 level = 1;
    f32 gold_value = 5;

    // Fire pattern
    f32 projectile_speed = 0; // 0 = default turret bullet speed
    u32 multi_shot = 1;
    f32 spread_angle = 0;     // radians across the whole fan
    std::optional<EffectPayload> projectile_effects;

    bool is_wall = false;
    bool is_structure = false;
    std::optional<MineTraits> mine;
    std::optional<BarracksTraits> barracks;
    std::optional<SupportTraits> support;
    std::optional<MobileTraits> mobile;
    std::optional<StasisFieldTraits> stasis_field;
    std::optional<BuffNodeTraits> buff_node;

    bool is_mine() const { return mine.has_value(); }
    bool is_barracks() const { return barracks.has_value(); }
    bool is_support() const { return support.has_value(); }
    bool is_mobile() const { return mobile.has_value(); }
    bool is_stasis_field() const { return stasis_field.has_value(); }
    bool is_buff_node() const { return buff_node.has_value(); }
};

} // namespace kuf::sim
