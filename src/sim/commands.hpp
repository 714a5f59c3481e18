#pragma once

#include "sim/entity.hpp" // Vector2

#include <optional>
#include <vector>

namespace kuf::sim {

class EntityStore;
class Marine;
struct Camera;
struct TargetingOverride;
struct ViewBounds;

/// Which marines receive move orders. With no explicit selection every
/// marine is commanded.
struct Selection {
    std::vector<u32> unit_ids;
    std::optional<Vector2> attack_move_waypoint;

    bool specific() const { return !unit_ids.empty(); }
};

/// Centered square lattice, one point per unit, spaced two diameters of
/// the largest unit apart, filled row by row.
std::vector<Vector2> formation_waypoints(const std::vector<Marine*>& units,
                                         const Vector2& center);

/// Focus every weapon on `enemy_id` and drop all waypoints. Returns false
/// if the id is not a living turret.
bool issue_target_command(EntityStore& store, TargetingOverride& targeting,
                          Selection& selection, u32 enemy_id);

/// Send the selected marines (or all of them) to `point` in formation.
void set_attack_move_waypoint(EntityStore& store, Selection& selection,
                              const Vector2& point);

/// Contextual tap at a world point: focus the enemy under it, otherwise
/// clear focus and attack-move there.
void handle_command_tap(EntityStore& store, TargetingOverride& targeting,
                        Selection& selection, const Vector2& point,
                        f32 tap_padding);

/// Select the marines whose on-screen position lies inside the rectangle
/// spanned by two screen corners. Returns the number selected.
size_t select_units_in_rect(const EntityStore& store, Selection& selection,
                            const Camera& camera, const ViewBounds& view,
                            const Vector2& corner_a, const Vector2& corner_b);

/// Back to "all units": drop the selection, waypoint and focus.
void clear_selection(Selection& selection, TargetingOverride& targeting);

} // namespace kuf::sim
