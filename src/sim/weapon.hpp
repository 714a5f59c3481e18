#pragma once

#include "core/types.hpp"

namespace kuf::sim {

class Entity;
class Marine;
class Turret;
struct SimContext;
struct SimConfig;

/// Advance a splayer's hull spin, boosted while its boost timer runs.
void update_splayer_spin(Marine& marine, const SimConfig& config, f64 dt);

/// Marine fire control: tick the cooldown, pick a target (the focused
/// enemy when in range, otherwise the nearest turret) and fire by type.
void update_marine_weapon(Marine& marine, const Turret* focused,
                          SimContext& ctx, f64 dt);

/// Fire one volley at `target`: `multi_shot` rounds fanned across the
/// spread angle, scaled by nearby buff nodes. Resets the cooldown.
void fire_turret(Turret& turret, const Entity& target, SimContext& ctx);

/// Stationary emplacement: fire at the nearest player target in range.
void update_turret_weapon(Turret& turret, SimContext& ctx);

/// Mobile raider: chase the nearest player target at any distance and
/// fire once within range.
void update_mobile_turret(Turret& turret, SimContext& ctx, f64 dt);

} // namespace kuf::sim
