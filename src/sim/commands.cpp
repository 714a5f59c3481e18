#include "sim/commands.hpp"
#include "sim/entity_store.hpp"
#include "sim/sim_state.hpp"
#include "sim/targeting.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

namespace {

// Living marines addressed by the current selection, in id order.
std::vector<Marine*> commanded_units(EntityStore& store,
                                     const Selection& selection) {
    std::vector<Marine*> units;
    if (!selection.specific()) {
        for (const auto& m : store.marines())
            units.push_back(m.get());
        return units;
    }
    for (u32 id : selection.unit_ids) {
        if (Marine* m = store.find_marine(id)) units.push_back(m);
    }
    return units;
}

} // namespace

std::vector<Vector2> formation_waypoints(const std::vector<Marine*>& units,
                                         const Vector2& center) {
    if (units.empty()) return {center};

    f32 max_radius = 0;
    for (const Marine* m : units)
        max_radius = std::max(max_radius, m->radius());
    f32 spacing = max_radius * 4;   // two diameters center to center

    size_t count = units.size();
    size_t columns =
        static_cast<size_t>(std::ceil(std::sqrt(static_cast<f32>(count))));
    size_t rows = (count + columns - 1) / columns;
    f32 x0 = -static_cast<f32>(columns - 1) * spacing / 2;
    f32 y0 = -static_cast<f32>(rows - 1) * spacing / 2;

    std::vector<Vector2> points;
    points.reserve(count);
    for (size_t i = 0; i < count; i++) {
        size_t row = i / columns;
        size_t column = i % columns;
        points.push_back({center.x + x0 + static_cast<f32>(column) * spacing,
                          center.y + y0 + static_cast<f32>(row) * spacing});
    }
    return points;
}

bool issue_target_command(EntityStore& store, TargetingOverride& targeting,
                          Selection& selection, u32 enemy_id) {
    Turret* enemy = store.find_turret(enemy_id);
    if (!enemy || !enemy->alive()) return false;

    targeting.focus(enemy_id);
    selection.attack_move_waypoint.reset();
    for (const auto& m : store.marines())
        m->waypoint.reset();
    spdlog::debug("Focus fire on {} #{}", enemy->type, enemy_id);
    return true;
}

void set_attack_move_waypoint(EntityStore& store, Selection& selection,
                              const Vector2& point) {
    selection.attack_move_waypoint = point;
    std::vector<Marine*> units = commanded_units(store, selection);
    std::vector<Vector2> slots = formation_waypoints(units, point);
    for (size_t i = 0; i < units.size(); i++)
        units[i]->waypoint = i < slots.size() ? slots[i] : point;
}

void handle_command_tap(EntityStore& store, TargetingOverride& targeting,
                        Selection& selection, const Vector2& point,
                        f32 tap_padding) {
    if (Turret* enemy = find_enemy_at_point(store, point, tap_padding)) {
        issue_target_command(store, targeting, selection, enemy->entity_id());
        return;
    }
    targeting.clear();
    set_attack_move_waypoint(store, selection, point);
}

size_t select_units_in_rect(const EntityStore& store, Selection& selection,
                            const Camera& camera, const ViewBounds& view,
                            const Vector2& corner_a, const Vector2& corner_b) {
    f32 min_x = std::min(corner_a.x, corner_b.x);
    f32 max_x = std::max(corner_a.x, corner_b.x);
    f32 min_y = std::min(corner_a.y, corner_b.y);
    f32 max_y = std::max(corner_a.y, corner_b.y);

    selection.unit_ids.clear();
    for (const auto& m : store.marines()) {
        Vector2 s = camera.world_to_screen(m->position(), view);
        if (s.x >= min_x && s.x <= max_x && s.y >= min_y && s.y <= max_y)
            selection.unit_ids.push_back(m->entity_id());
    }
    return selection.unit_ids.size();
}

void clear_selection(Selection& selection, TargetingOverride& targeting) {
    selection.unit_ids.clear();
    selection.attack_move_waypoint.reset();
    targeting.clear();
}

} // namespace kuf::sim
