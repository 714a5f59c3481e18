#include "sim/player_units.hpp"
#include "sim/sim_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kuf::sim {

namespace {

constexpr UnitStats MARINE_BASE{10, 1, 1};
constexpr UnitStats SNIPER_BASE{8, 2, 0.5f};
constexpr UnitStats SPLAYER_BASE{12, 0.8f, 0.7f};
constexpr UnitStats LASER_BASE{9, 1.5f, 0.6f};

// Per-shard increments
constexpr f32 HEALTH_PER_SHARD = 2.0f;
constexpr f32 ATTACK_PER_SHARD = 0.5f;
constexpr f32 ATTACK_SPEED_PER_SHARD = 0.1f;

constexpr f32 MIN_ATTACK_SPEED = 0.1f;
constexpr f32 MAX_INITIAL_COOLDOWN = 0.5f;

} // namespace

const char* marine_type_name(MarineType type) {
    switch (type) {
    case MarineType::Marine: return "marine";
    case MarineType::Sniper: return "sniper";
    case MarineType::Splayer: return "splayer";
    case MarineType::Laser: return "laser";
    case MarineType::Worker: return "worker";
    case MarineType::DroneSupport: return "drone-support";
    }
    return "marine";
}

std::optional<MarineType> parse_marine_type(std::string_view name) {
    if (name == "marine") return MarineType::Marine;
    if (name == "sniper") return MarineType::Sniper;
    if (name == "splayer") return MarineType::Splayer;
    if (name == "laser") return MarineType::Laser;
    if (name == "worker") return MarineType::Worker;
    if (name == "drone-support") return MarineType::DroneSupport;
    return std::nullopt;
}

UnitStats calculate_unit_stats(std::string_view unit_type,
                               const UnitUpgrades& upgrades) {
    UnitStats base;
    if (unit_type == "marines")
        base = MARINE_BASE;
    else if (unit_type == "snipers")
        base = SNIPER_BASE;
    else if (unit_type == "splayers")
        base = SPLAYER_BASE;
    else if (unit_type == "lasers")
        base = LASER_BASE;
    else
        return {};

    return {base.health + static_cast<f32>(upgrades.health) * HEALTH_PER_SHARD,
            base.attack + static_cast<f32>(upgrades.attack) * ATTACK_PER_SHARD,
            base.attack_speed +
                static_cast<f32>(upgrades.attack_speed) * ATTACK_SPEED_PER_SHARD};
}

const UnitStats& UnitStatTable::for_type(MarineType type) const {
    switch (type) {
    case MarineType::Sniper: return sniper;
    case MarineType::Splayer: return splayer;
    case MarineType::Laser: return laser;
    default: return marine;
    }
}

const UnitProfile& unit_profile(const SimConfig& config, MarineType type) {
    switch (type) {
    case MarineType::Sniper: return config.sniper;
    case MarineType::Splayer: return config.splayer;
    case MarineType::Laser: return config.laser;
    default: return config.marine;
    }
}

std::unique_ptr<Marine> make_player_unit(MarineType type,
                                         const UnitStats& stats,
                                         const Vector2& position,
                                         const SimConfig& config,
                                         std::mt19937& rng) {
    std::uniform_real_distribution<f32> unit(0.0f, 1.0f);
    const UnitProfile& profile = unit_profile(config, type);

    auto m = std::make_unique<Marine>();
    m->type = type;
    m->set_position(position);
    m->set_radius(profile.radius);
    m->set_max_health(stats.health);
    m->set_health(stats.health);
    m->attack = stats.attack;
    m->attack_speed = std::max(MIN_ATTACK_SPEED, stats.attack_speed);
    m->cooldown = unit(rng) * MAX_INITIAL_COOLDOWN;
    m->base_move_speed = profile.move_speed;
    m->move_speed = profile.move_speed;
    m->range = profile.range;
    if (type == MarineType::Splayer) {
        m->rotation = unit(rng) * TWO_PI;
        m->rotation_speed = config.splayer_base_spin_speed;
    }
    return m;
}

Marine& create_player_unit(SimContext& ctx, MarineType type,
                           const UnitStats& stats, const Vector2& position) {
    Marine& m = ctx.store.add_marine(
        make_player_unit(type, stats, position, ctx.config, ctx.rng));
    spdlog::debug("Deployed {} #{} at ({:.1f}, {:.1f})", marine_type_name(type),
                  m.entity_id(), position.x, position.y);
    return m;
}

} // namespace kuf::sim
