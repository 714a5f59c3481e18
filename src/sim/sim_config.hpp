#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace kuf::sim {

/// Movement/engagement profile of one player unit archetype.
struct UnitProfile {
    f32 radius = 3.6f;
    f32 move_speed = 70.0f;   // world units per second
    f32 range = 160.0f;
    f32 bullet_speed = 360.0f;
};

/// One entry of the training toolbar catalog.
struct TrainingCatalogEntry {
    std::string id;
    std::string label;
    f32 cost = 0;
    f32 duration = 1;         // seconds
};

/// Fixed fire-control parameters of the core ship's cannons and hull.
struct CoreShipCombatConfig {
    f32 cannon_range = 220.0f;
    f32 cannon_spread = 0.35f;           // radians across the whole fan
    f32 cannon_projectile_speed = 320.0f;
    f32 cannon_damage = 1.0f;
    f32 cannon_attack_speed = 1.0f;      // volleys per second
    f32 collision_scale = 0.6f;
    f32 base_radius = 18.0f;
    f32 healing_aura_radius = 150.0f;
    f32 shield_per_upgrade = 50.0f;
    f32 shield_regen_base = 5.0f;
    f32 shield_regen_per_upgrade = 2.0f;
    f32 shield_regen_delay = 3.0f;
    f32 repair_interval = 0.1f;          // hull repair / aura pulse cadence
    f32 drone_spawn_offset = 15.0f;
};

struct DroneConfig {
    f32 radius = 4.0f;
    f32 attack_speed = 1.5f;
    f32 move_speed = 80.0f;
    f32 range = 120.0f;
};

/// All tuning constants of the encounter. Defaults are the shipped balance;
/// data scripts may override them through the KufTuning table.
struct SimConfig {
    UnitProfile marine{3.6f, 70.0f, 160.0f, 360.0f};
    UnitProfile sniper{3.2f, 56.0f, 280.0f, 500.0f};
    UnitProfile splayer{4.0f, 63.0f, 200.0f, 200.0f};
    UnitProfile laser{3.4f, 59.5f, 220.0f, 420.0f};

    f32 unit_acceleration = 120.0f;      // world units per second squared
    f32 arrival_tolerance = 5.0f;
    f32 target_hold_buffer = 6.0f;

    u32 splayer_rocket_count = 8;
    f32 splayer_rocket_damage_scale = 0.25f;
    f32 splayer_base_spin_speed = 1.2f;  // radians per second
    f32 splayer_spin_boost_multiplier = 3.0f;
    f32 splayer_spin_boost_duration = 0.6f;
    u32 laser_pierce_count = 3;

    f32 turret_bullet_speed = 280.0f;
    f32 bullet_life = 2.5f;
    f32 homing_turn_rate = 3.0f;         // radians per second
    f32 bullet_culling_margin = 400.0f;

    f32 mine_explosion_radius = 60.0f;
    f32 explosion_life = 0.5f;
    f32 barracks_spawn_offset = 10.0f;
    f32 support_heal_visual = 0.25f;
    f32 field_pulse_period = 1.5f;

    f32 min_slow_multiplier = 0.2f;
    f32 min_effect_slow = 0.1f;
    f32 max_field_slow_amount = 0.9f;

    CoreShipCombatConfig core_ship;
    DroneConfig drone;

    f32 worker_base_cost = 2.0f;
    f32 worker_cost_increment = 2.0f;
    f32 starting_gold_per_level = 10.0f;
    f32 spawn_jitter = 14.0f;
    f32 spawn_area_margin = 24.0f;
    f32 grid_unit = 36.0f;               // 5 marine diameters
    f32 grid_origin_bottom_offset = 48.0f;
    f32 lane_exit_y = -40.0f;            // world-space despawn line
    f32 camera_smoothing = 2.0f;
    f32 enemy_tap_padding = 6.0f;
    f32 max_frame_delta = 0.064f;

    std::vector<TrainingCatalogEntry> training_catalog{
        {"worker", "Worker", 2.0f, 3.0f},
        {"marine", "Marine", 15.0f, 5.0f},
        {"sniper", "Sniper", 25.0f, 8.0f},
        {"splayer", "Splayer", 40.0f, 12.0f},
        {"laser", "Piercing Laser", 30.0f, 10.0f},
    };
    std::vector<std::string> equipable_unit_ids{"marine", "sniper", "splayer",
                                                "laser"};
    std::vector<std::string> default_slot_units{"worker", "marine", "sniper",
                                                "splayer"};
};

} // namespace kuf::sim
