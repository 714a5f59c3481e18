#pragma once

#include "sim/turret.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kuf::sim {

struct SimContext;

/// Level-1 template of one enemy type. Health and attack scale with level
/// at spawn; everything else is copied as-is.
struct EnemyArchetype {
    std::string type;
    std::string name;
    f32 radius = 0;
    f32 health = 1;
    f32 attack = 0;
    f32 attack_speed = 0;
    f32 range = 0;
    f32 gold_value = 5;

    f32 projectile_speed = 0;
    u32 multi_shot = 1;
    f32 spread_angle = 0;
    std::optional<EffectPayload> projectile_effects;

    bool is_wall = false;
    bool is_structure = false;
    std::optional<MineTraits> mine;
    std::optional<BarracksTraits> barracks;
    std::optional<SupportTraits> support;
    std::optional<MobileTraits> mobile;
    std::optional<StasisFieldTraits> stasis_field;
    std::optional<BuffNodeTraits> buff_node;
};

class EnemyCatalog {
public:
    /// The shipped roster, in almanac order.
    static EnemyCatalog with_defaults();

    /// Insert or replace an archetype by type id.
    void add(EnemyArchetype archetype);

    /// Look up an archetype by type id. Returns nullptr if not found.
    const EnemyArchetype* find(const std::string& type) const;

    size_t size() const { return archetypes_.size(); }
    const std::vector<EnemyArchetype>& archetypes() const { return archetypes_; }

private:
    std::vector<EnemyArchetype> archetypes_;
    std::unordered_map<std::string, size_t> index_;
};

/// Instantiate an archetype at `level` (clamped to at least 1).
std::unique_ptr<Turret> make_enemy(const EnemyArchetype& archetype,
                                   const Vector2& position, u32 level);

/// Spawn an enemy of `type` into the store. Unknown types log a warning
/// and return nullptr.
Turret* create_enemy(SimContext& ctx, const std::string& type,
                     const Vector2& position, u32 level);

} // namespace kuf::sim
