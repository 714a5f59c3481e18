#pragma once

#include "sim/entity.hpp" // Vector2

#include <string>
#include <vector>

namespace kuf::sim {

struct SimConfig;
struct ViewBounds;

inline constexpr const char* FALLBACK_MAP_ID = "forward-bastion";

/// One pre-placed enemy. Grid (0, 0) is the player spawn point; +x is
/// east and +y is north (toward the enemy lines).
struct LayoutEntry {
    std::string type;
    i32 grid_x = 0;
    i32 grid_y = 0;
    u32 level = 1;
};

struct BattlefieldMap {
    std::string id;
    std::string name;
    std::string description;
    std::vector<LayoutEntry> layout;

    /// Highest enemy level on the map, at least 1.
    u32 highest_level() const;
};

/// Ordered set of maps. The first map is the default. Unknown ids fall back
/// to FALLBACK_MAP_ID when registered, otherwise to the default.
class MapLibrary {
public:
    /// Insert or replace a map by id.
    void add(BattlefieldMap map);

    /// Look up a map with fallback. Returns nullptr only when the library
    /// is empty.
    const BattlefieldMap* resolve(const std::string& id) const;

    /// Exact lookup. Returns nullptr if not found.
    const BattlefieldMap* find(const std::string& id) const;

    std::string default_map_id() const;

    size_t size() const { return maps_.size(); }
    bool empty() const { return maps_.empty(); }
    const std::vector<BattlefieldMap>& maps() const { return maps_; }

private:
    std::vector<BattlefieldMap> maps_;
};

/// Convert grid coordinates to world space:
/// x = width / 2 + gx * unit, y = (height - bottom_offset) - gy * unit.
Vector2 grid_to_world(i32 grid_x, i32 grid_y, const ViewBounds& view,
                      const SimConfig& config);

} // namespace kuf::sim
