#pragma once

#include "sim/entity.hpp"

#include <optional>

namespace kuf::sim {

class EntityStore;
class Marine;
class Turret;

/// Player-pinned enemy. Weapons prefer it whenever it is in range, and
/// marines without a waypoint hold at firing distance from it.
struct TargetingOverride {
    std::optional<u32> focused_enemy_id;

    void focus(u32 id) { focused_enemy_id = id; }
    void clear() { focused_enemy_id.reset(); }
    bool active() const { return focused_enemy_id.has_value(); }
};

/// Returns the focused turret, clearing the override if it is dead or gone.
Turret* resolve_focused_enemy(const EntityStore& store,
                              TargetingOverride& targeting);

/// Nearest turret within `range`. A living focused enemy in range wins
/// outright. Equal distances resolve to the lowest id.
Turret* find_closest_turret(const EntityStore& store,
                            const TargetingOverride& targeting,
                            const Vector2& from, f32 range);

Marine* find_closest_marine(const EntityStore& store, const Vector2& from,
                            f32 range);

/// Nearest of marines, drones and the living core ship hull. On equal
/// distance marines win over drones, drones over the core ship.
Entity* find_closest_player_target(const EntityStore& store,
                                   const Vector2& from, f32 range);

/// Nearest turret below max health, skipping `exclude_id`.
Turret* find_damaged_turret(const EntityStore& store, const Vector2& from,
                            f32 range, u32 exclude_id);

/// First turret (in id order) whose padded radius contains `point`.
Turret* find_enemy_at_point(const EntityStore& store, const Vector2& point,
                            f32 padding);

} // namespace kuf::sim
