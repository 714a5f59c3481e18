#pragma once

#include "core/types.hpp"

namespace kuf::sim {

class EntityStore;
class Turret;
struct SimContext;

/// Count down the spawn timer; once it has elapsed and the cap allows,
/// spawn the barracks' unit type if a player target is in reach.
void update_barracks(Turret& barracks, SimContext& ctx, f64 dt);

/// Seek the nearest damaged turret within sight; approach it, or heal it
/// once inside heal range.
void update_support(Turret& support, SimContext& ctx, f64 dt);

/// Damage every marine and turret within the blast radius by
/// attack * level and leave an explosion ring. A mine detonates once.
void detonate_mine(Turret& mine, SimContext& ctx);

/// Detonate every dead mine (repeating while detonations kill further
/// mines), then remove every dead turret. Returns the number removed.
size_t reap_destroyed_turrets(SimContext& ctx);

/// Grow each explosion ring with its age and drop the expired ones.
void update_explosions(EntityStore& store, f64 dt);

} // namespace kuf::sim
