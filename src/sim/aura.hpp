#pragma once

#include "core/types.hpp"

namespace kuf::sim {

class EntityStore;
class Marine;
class Turret;
struct SimConfig;

struct AttackModifier {
    f32 attack_speed_multiplier = 1.0f;
    f32 damage_multiplier = 1.0f;
};

/// Product of every other buff node's multipliers whose buff radius
/// covers `turret`.
AttackModifier get_turret_attack_modifier(const EntityStore& store,
                                          const Turret& turret);

/// Product of (1 - slow_amount) over stasis fields covering `marine`, each
/// slow capped at `config.max_field_slow_amount`, floored at
/// `config.min_slow_multiplier`.
f32 get_field_slow_multiplier(const EntityStore& store, const Marine& marine,
                              const SimConfig& config);

/// Advance the stasis field's presentation pulse, wrapping each period.
void advance_field_pulse(Turret& turret, const SimConfig& config, f64 dt);

} // namespace kuf::sim
