#include "sim/aura.hpp"
#include "sim/entity_store.hpp"
#include "sim/sim_config.hpp"

#include <algorithm>
#include <cmath>

namespace kuf::sim {

AttackModifier get_turret_attack_modifier(const EntityStore& store,
                                          const Turret& turret) {
    AttackModifier mod;
    for (const auto& node : store.turrets()) {
        if (node.get() == &turret || !node->is_buff_node()) continue;
        const BuffNodeTraits& buff = *node->buff_node;
        if (buff.buff_radius <= 0) continue;
        if (distance_squared(node->position(), turret.position()) >
            buff.buff_radius * buff.buff_radius)
            continue;
        if (buff.attack_speed_multiplier > 0)
            mod.attack_speed_multiplier *= buff.attack_speed_multiplier;
        if (buff.damage_multiplier > 0)
            mod.damage_multiplier *= buff.damage_multiplier;
    }
    return mod;
}

f32 get_field_slow_multiplier(const EntityStore& store, const Marine& marine,
                              const SimConfig& config) {
    f32 multiplier = 1.0f;
    for (const auto& t : store.turrets()) {
        if (!t->is_stasis_field()) continue;
        const StasisFieldTraits& field = *t->stasis_field;
        if (field.slow_radius <= 0) continue;
        if (distance_squared(t->position(), marine.position()) <=
            field.slow_radius * field.slow_radius)
            multiplier *=
                1.0f - std::min(config.max_field_slow_amount, field.slow_amount);
    }
    return std::max(config.min_slow_multiplier, multiplier);
}

void advance_field_pulse(Turret& turret, const SimConfig& config, f64 dt) {
    if (!turret.stasis_field || config.field_pulse_period <= 0) return;
    f32& pulse = turret.stasis_field->field_pulse;
    pulse = std::fmod(pulse + static_cast<f32>(dt), config.field_pulse_period);
}

} // namespace kuf::sim
