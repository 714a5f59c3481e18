#include "sim/targeting.hpp"
#include "sim/entity_store.hpp"

namespace kuf::sim {

namespace {

// Nearest entity of one pool within range, in id order. Strict comparison
// keeps the lower id on ties. `best_d2` receives the winning distance.
template <typename T, typename Filter>
T* scan_nearest(const std::vector<std::unique_ptr<T>>& pool,
                const Vector2& from, f32 range, f32& best_d2,
                Filter&& filter) {
    f32 range2 = range * range;
    T* best = nullptr;
    for (const auto& e : pool) {
        if (!filter(*e)) continue;
        f32 d2 = distance_squared(from, e->position());
        if (d2 > range2) continue;
        if (!best || d2 < best_d2) {
            best = e.get();
            best_d2 = d2;
        }
    }
    return best;
}

// Entities that died earlier in the tick stay pooled until reaped.
template <typename T>
bool is_alive(const T& e) { return e.alive(); }

} // namespace

Turret* resolve_focused_enemy(const EntityStore& store,
                              TargetingOverride& targeting) {
    if (!targeting.active()) return nullptr;
    Turret* t = store.find_turret(*targeting.focused_enemy_id);
    if (!t || !t->alive()) {
        targeting.clear();
        return nullptr;
    }
    return t;
}

Turret* find_closest_turret(const EntityStore& store,
                            const TargetingOverride& targeting,
                            const Vector2& from, f32 range) {
    if (targeting.active()) {
        Turret* focused = store.find_turret(*targeting.focused_enemy_id);
        if (focused && focused->alive() &&
            distance_squared(from, focused->position()) <= range * range)
            return focused;
    }

    f32 best_d2 = 0;
    return scan_nearest(store.turrets(), from, range, best_d2,
                        is_alive<Turret>);
}

Marine* find_closest_marine(const EntityStore& store, const Vector2& from,
                            f32 range) {
    f32 best_d2 = 0;
    return scan_nearest(store.marines(), from, range, best_d2,
                        is_alive<Marine>);
}

Entity* find_closest_player_target(const EntityStore& store,
                                   const Vector2& from, f32 range) {
    f32 best_d2 = 0;
    Entity* best = scan_nearest(store.marines(), from, range, best_d2,
                                is_alive<Marine>);

    f32 drone_d2 = 0;
    Drone* drone = scan_nearest(store.drones(), from, range, drone_d2,
                                is_alive<Drone>);
    if (drone && (!best || drone_d2 < best_d2)) {
        best = drone;
        best_d2 = drone_d2;
    }

    CoreShip* ship = store.core_ship();
    if (ship && ship->alive()) {
        f32 d2 = distance_squared(from, ship->position());
        if (d2 <= range * range && (!best || d2 < best_d2))
            best = ship;
    }
    return best;
}

Turret* find_damaged_turret(const EntityStore& store, const Vector2& from,
                            f32 range, u32 exclude_id) {
    f32 best_d2 = 0;
    return scan_nearest(store.turrets(), from, range, best_d2,
                        [exclude_id](const Turret& t) {
                            return t.entity_id() != exclude_id && t.alive() &&
                                   t.damaged();
                        });
}

Turret* find_enemy_at_point(const EntityStore& store, const Vector2& point,
                            f32 padding) {
    for (const auto& t : store.turrets()) {
        f32 r = t->radius() + padding;
        if (distance_squared(point, t->position()) <= r * r)
            return t.get();
    }
    return nullptr;
}

} // namespace kuf::sim
