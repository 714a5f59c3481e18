#pragma once

#include "sim/marine.hpp"

#include <memory>
#include <random>
#include <string_view>

namespace kuf::sim {

struct SimConfig;
struct SimContext;
struct UnitProfile;

/// Combat stat block of one unit archetype.
struct UnitStats {
    f32 health = 0;
    f32 attack = 0;
    f32 attack_speed = 0;
};

/// Shards allocated to each stat of one archetype.
struct UnitUpgrades {
    u32 health = 0;
    u32 attack = 0;
    u32 attack_speed = 0;
};

/// Per-archetype base stats plus shard upgrades. `unit_type` is the plural
/// roster key ("marines", "snipers", "splayers", "lasers"); anything else
/// yields an all-zero block.
UnitStats calculate_unit_stats(std::string_view unit_type,
                               const UnitUpgrades& upgrades = {});

/// Stat blocks the encounter was started with, one per trainable archetype.
struct UnitStatTable {
    UnitStats marine = calculate_unit_stats("marines");
    UnitStats sniper = calculate_unit_stats("snipers");
    UnitStats splayer = calculate_unit_stats("splayers");
    UnitStats laser = calculate_unit_stats("lasers");

    /// Falls back to the marine block for non-combat types.
    const UnitStats& for_type(MarineType type) const;
};

/// Movement/engagement profile for a type. Non-combat types use the
/// marine profile.
const UnitProfile& unit_profile(const SimConfig& config, MarineType type);

std::unique_ptr<Marine> make_player_unit(MarineType type,
                                         const UnitStats& stats,
                                         const Vector2& position,
                                         const SimConfig& config,
                                         std::mt19937& rng);

Marine& create_player_unit(SimContext& ctx, MarineType type,
                           const UnitStats& stats, const Vector2& position);

} // namespace kuf::sim
