#include "sim/battlefield.hpp"
#include "sim/sim_state.hpp"

#include <algorithm>

namespace kuf::sim {

u32 BattlefieldMap::highest_level() const {
    u32 level = 1;
    for (const auto& entry : layout)
        level = std::max(level, entry.level);
    return level;
}

void MapLibrary::add(BattlefieldMap map) {
    for (auto& existing : maps_) {
        if (existing.id == map.id) {
            existing = std::move(map);
            return;
        }
    }
    maps_.push_back(std::move(map));
}

const BattlefieldMap* MapLibrary::find(const std::string& id) const {
    for (const auto& map : maps_) {
        if (map.id == id) return &map;
    }
    return nullptr;
}

const BattlefieldMap* MapLibrary::resolve(const std::string& id) const {
    if (const BattlefieldMap* map = find(id)) return map;
    if (const BattlefieldMap* map = find(FALLBACK_MAP_ID)) return map;
    return maps_.empty() ? nullptr : &maps_.front();
}

std::string MapLibrary::default_map_id() const {
    return maps_.empty() ? FALLBACK_MAP_ID : maps_.front().id;
}

Vector2 grid_to_world(i32 grid_x, i32 grid_y, const ViewBounds& view,
                      const SimConfig& config) {
    return {view.width / 2 + static_cast<f32>(grid_x) * config.grid_unit,
            (view.height - config.grid_origin_bottom_offset) -
                static_cast<f32>(grid_y) * config.grid_unit};
}

} // namespace kuf::sim
