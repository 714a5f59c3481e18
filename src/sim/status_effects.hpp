#pragma once

#include "sim/marine.hpp"

namespace kuf::sim {

class EntityStore;
struct SimConfig;

/// Attach the payload carried by an enemy round. Slow multipliers are
/// floored at `config.min_effect_slow`; zero durations fall back to 2 s.
void apply_effect(Marine& marine, const EffectPayload& payload,
                  const SimConfig& config);

/// Tick every effect: burn damage, expiry, and recompute move speed from
/// the combined status and stasis-field slow, floored at
/// `config.min_slow_multiplier`.
void update_marine_status(Marine& marine, const EntityStore& store,
                          const SimConfig& config, f64 dt);

} // namespace kuf::sim
