#include "sim/sim_state.hpp"
#include "sim/aura.hpp"
#include "sim/movement.hpp"
#include "sim/projectile.hpp"
#include "sim/status_effects.hpp"
#include "sim/structures.hpp"
#include "sim/weapon.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

SimState::SimState(SimConfig config, EnemyCatalog catalog, u32 seed)
    : config_(std::move(config)), catalog_(std::move(catalog)), rng_(seed) {
    training_.reset(config_);
}

SimState::~SimState() = default;

SimContext SimState::context() {
    return SimContext{store_,  config_, targeting_, economy_,
                      rng_,    camera_, view_,      catalog_,
                      base_world_position()};
}

Vector2 SimState::base_world_position() const {
    Vector2 anchor = base_anchor_.value_or(
        Vector2{view_.width / 2, view_.height - config_.grid_origin_bottom_offset});
    return camera_.screen_to_world(anchor, view_);
}

void SimState::start(const BattleSetup& setup) {
    store_.clear();
    targeting_.clear();
    selection_ = {};
    economy_ = {};
    training_.reset(config_);
    unit_stats_ = setup.unit_stats;
    outcome_ = BattleOutcome::InProgress;
    tick_count_ = 0;
    game_time_ = 0.0;
    camera_.x = 0;
    camera_.y = 0;

    SimContext ctx = context();
    auto ship = std::make_unique<CoreShip>(
        make_core_ship(setup.core_ship, ctx.base_anchor, config_));
    store_.set_core_ship(std::move(ship));

    spawn_starting_units(MarineType::Marine, setup.marines, unit_stats_.marine, ctx);
    spawn_starting_units(MarineType::Sniper, setup.snipers, unit_stats_.sniper, ctx);
    spawn_starting_units(MarineType::Splayer, setup.splayers, unit_stats_.splayer,
                         ctx);
    spawn_starting_units(MarineType::Laser, setup.lasers, unit_stats_.laser, ctx);

    const BattlefieldMap* map = maps_.resolve(setup.map_id);
    if (map) {
        if (map->id != setup.map_id && !setup.map_id.empty())
            spdlog::warn("Unknown battlefield '{}', using '{}'", setup.map_id,
                         map->id);
        active_map_id_ = map->id;
        build_turrets(*map, ctx);
    } else {
        spdlog::warn("No battlefield maps registered");
        active_map_id_ = setup.map_id.empty() ? maps_.default_map_id()
                                              : setup.map_id;
    }

    u32 highest_level = map ? map->highest_level() : 1;
    economy_.gold = config_.starting_gold_per_level * static_cast<f32>(highest_level);

    active_ = true;
    spdlog::info("Battle started on '{}': {} units, {} enemies, {:.0f} gold",
                 active_map_id_, store_.marines().size(), store_.turrets().size(),
                 economy_.gold);
}

void SimState::spawn_starting_units(MarineType type, u32 count,
                                    const UnitStats& stats, SimContext& ctx) {
    f32 margin = config_.spawn_area_margin;
    f32 x_min = margin;
    f32 x_max = view_.width - margin;
    f32 y_min = view_.height / 2;
    f32 y_max = view_.height - margin;
    for (u32 i = 0; i < count; i++) {
        Vector2 at{x_min + ctx.random() * (x_max - x_min),
                   y_min + ctx.random() * (y_max - y_min)};
        create_player_unit(ctx, type, stats, at);
    }
}

void SimState::build_turrets(const BattlefieldMap& map, SimContext& ctx) {
    for (const auto& entry : map.layout) {
        Vector2 at = grid_to_world(entry.grid_x, entry.grid_y, view_, config_);
        create_enemy(ctx, entry.type, at, entry.level);
    }
}

void SimState::tick(f64 delta) {
    if (!active_) return;
    if (!std::isfinite(delta)) delta = 0;
    delta = std::clamp(delta, 0.0, static_cast<f64>(config_.max_frame_delta));

    tick_count_++;
    game_time_ += delta;

    SimContext ctx = context();

    training_.update(delta, economy_, config_, [&](const std::string& unit_id) {
        spawn_trained_unit(unit_id, ctx);
    });
    update_marines(delta, ctx);
    reap_player_units();
    if (CoreShip* ship = store_.core_ship())
        ship->update(delta, ctx);
    update_drones(delta, ctx);
    update_turrets(delta, ctx);
    update_projectiles(delta, ctx);
    reap_destroyed_turrets(ctx);
    reap_player_units();
    update_explosions(store_, delta);
    update_camera(delta);
    check_outcome();
}

void SimState::spawn_trained_unit(const std::string& unit_id, SimContext& ctx) {
    auto type = parse_marine_type(unit_id);
    if (type == MarineType::Worker) {
        economy_.hire_worker();
        spdlog::debug("Worker trained: {} workers, +{:.0f} gold per kill",
                      economy_.worker_count, economy_.income_per_kill);
        return;
    }
    if (!type) {
        spdlog::warn("Unknown trained unit '{}', deploying a marine", unit_id);
        type = MarineType::Marine;
    }
    f32 jitter = config_.spawn_jitter;
    Vector2 at{ctx.base_anchor.x + (ctx.random() - 0.5f) * jitter,
               ctx.base_anchor.y + (ctx.random() - 0.5f) * jitter};
    create_player_unit(ctx, *type, unit_stats_.for_type(*type), at);
}

void SimState::update_marines(f64 dt, SimContext& ctx) {
    const Turret* focused = resolve_focused_enemy(store_, targeting_);
    for (const auto& m : store_.marines()) {
        update_marine_status(*m, store_, config_, dt);
        if (!m->alive()) continue;
        update_splayer_spin(*m, config_, dt);
        update_marine_weapon(*m, focused, ctx, dt);
        update_marine_movement(*m, focused, config_, dt);
    }
}

void SimState::update_drones(f64 dt, SimContext& ctx) {
    for (const auto& d : store_.drones()) {
        if (d->alive()) d->update(dt, ctx);
    }
}

void SimState::update_turrets(f64 dt, SimContext& ctx) {
    f32 step = static_cast<f32>(dt);
    // Barracks append to the pool; spawns start acting next tick
    size_t count = store_.turrets().size();
    for (size_t i = 0; i < count; i++) {
        Turret& t = *store_.turrets()[i];
        t.cooldown = std::max(0.0f, t.cooldown - step);
        advance_field_pulse(t, config_, dt);
        if (t.support)
            t.support->heal_visual_timer =
                std::max(0.0f, t.support->heal_visual_timer - step);

        if (t.is_barracks())
            update_barracks(t, ctx, dt);
        else if (t.is_support())
            update_support(t, ctx, dt);
        else if (t.is_mobile())
            update_mobile_turret(t, ctx, dt);
        else
            update_turret_weapon(t, ctx);
    }
}

void SimState::reap_player_units() {
    f32 exit_y = config_.lane_exit_y;
    size_t lost = store_.remove_marines_if([exit_y](const Marine& m) {
        return !m.alive() || m.y() + m.radius() <= exit_y;
    });
    if (lost > 0) {
        // Drop selections that no longer resolve
        auto& ids = selection_.unit_ids;
        ids.erase(std::remove_if(ids.begin(), ids.end(),
                                 [this](u32 id) { return !store_.find_marine(id); }),
                  ids.end());
    }
    store_.remove_drones_if([](const Drone& d) { return !d.alive(); });
}

void SimState::update_camera(f64 dt) {
    if (camera_.locked || store_.marines().empty()) return;

    const Marine* forward = store_.marines().front().get();
    for (const auto& m : store_.marines()) {
        if (m->y() < forward->y()) forward = m.get();
    }
    f32 zoom = camera_.zoom > 0 ? camera_.zoom : 1.0f;
    f32 target_x = forward->x() - view_.width / 2 / zoom;
    f32 target_y = forward->y() - view_.height / 2 / zoom;
    f32 k = config_.camera_smoothing * static_cast<f32>(dt);
    camera_.x += (target_x - camera_.x) * k;
    camera_.y += (target_y - camera_.y) * k;
}

void SimState::check_outcome() {
    const CoreShip* ship = store_.core_ship();
    if (ship && !ship->alive()) {
        complete(false);
        return;
    }
    if (store_.turrets().empty())
        complete(true);
}

void SimState::complete(bool victory) {
    active_ = false;
    outcome_ = victory ? BattleOutcome::Victory : BattleOutcome::Defeat;
    BattleResult result{economy_.gold, victory, economy_.destroyed_turrets,
                        active_map_id_};
    spdlog::info("Battle on '{}' ended in {} after {:.1f}s: {} destroyed, "
                 "{:.0f} gold",
                 result.map_id, victory ? "victory" : "defeat", game_time_,
                 result.destroyed_turrets, result.gold_earned);
    if (on_complete_) on_complete_(result);
}

// Commands

bool SimState::issue_target_command(u32 enemy_id) {
    return sim::issue_target_command(store_, targeting_, selection_, enemy_id);
}

void SimState::handle_command_tap(const Vector2& screen) {
    sim::handle_command_tap(store_, targeting_, selection_,
                            camera_.screen_to_world(screen, view_),
                            config_.enemy_tap_padding);
}

void SimState::set_attack_move_waypoint(const Vector2& world) {
    sim::set_attack_move_waypoint(store_, selection_, world);
}

size_t SimState::select_units_in_rect(const Vector2& screen_a,
                                      const Vector2& screen_b) {
    return sim::select_units_in_rect(store_, selection_, camera_, view_,
                                     screen_a, screen_b);
}

void SimState::clear_selection() {
    sim::clear_selection(selection_, targeting_);
}

TrainingResult SimState::try_start_training(size_t slot) {
    if (!active_) return {false, "Battle is not running"};
    return training_.try_start(slot, economy_, config_);
}

bool SimState::cycle_training_slot(size_t slot) {
    return training_.cycle_slot(slot, config_);
}

} // namespace kuf::sim
