#include "sim/status_effects.hpp"
#include "sim/aura.hpp"
#include "sim/sim_config.hpp"

#include <algorithm>

namespace kuf::sim {

namespace {

constexpr f32 DEFAULT_EFFECT_DURATION = 2.0f;
constexpr f32 DEFAULT_BURN_DPS = 1.0f;
constexpr f32 DEFAULT_SLOW_MULTIPLIER = 0.5f;

} // namespace

void apply_effect(Marine& marine, const EffectPayload& payload,
                  const SimConfig& config) {
    StatusEffect effect;
    effect.kind = payload.kind;
    effect.remaining =
        payload.duration > 0 ? payload.duration : DEFAULT_EFFECT_DURATION;
    switch (payload.kind) {
    case StatusKind::Burn:
        effect.magnitude =
            payload.magnitude > 0 ? payload.magnitude : DEFAULT_BURN_DPS;
        break;
    case StatusKind::Slow:
        effect.magnitude = std::max(
            config.min_effect_slow,
            payload.magnitude > 0 ? payload.magnitude : DEFAULT_SLOW_MULTIPLIER);
        break;
    }
    marine.status_effects.push_back(effect);
}

void update_marine_status(Marine& marine, const EntityStore& store,
                          const SimConfig& config, f64 dt) {
    f32 step = static_cast<f32>(dt);
    f32 slow = 1.0f;

    for (auto& effect : marine.status_effects) {
        effect.remaining = std::max(0.0f, effect.remaining - step);
        if (effect.kind == StatusKind::Burn)
            marine.apply_damage(effect.magnitude * step);
        else
            slow *= std::max(config.min_effect_slow, effect.magnitude);
    }
    marine.status_effects.erase(
        std::remove_if(marine.status_effects.begin(),
                       marine.status_effects.end(),
                       [](const StatusEffect& e) { return e.remaining <= 0; }),
        marine.status_effects.end());

    f32 field = get_field_slow_multiplier(store, marine, config);
    marine.move_speed = marine.base_move_speed *
                        std::max(config.min_slow_multiplier, slow * field);
}

} // namespace kuf::sim
