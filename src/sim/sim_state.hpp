#pragma once

#include "sim/battlefield.hpp"
#include "sim/commands.hpp"
#include "sim/core_ship.hpp"
#include "sim/enemy_catalog.hpp"
#include "sim/entity_store.hpp"
#include "sim/player_units.hpp"
#include "sim/sim_config.hpp"
#include "sim/targeting.hpp"
#include "sim/training.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <optional>
#include <random>
#include <string>

namespace kuf::sim {

/// Size of the rendered area, in screen units.
struct ViewBounds {
    f32 width = 800.0f;
    f32 height = 600.0f;
};

/// Pan/zoom of the view over the battlefield. `locked` suspends the
/// automatic follow (e.g. while the host is dragging the view).
struct Camera {
    f32 x = 0;
    f32 y = 0;
    f32 zoom = 1.0f;
    bool locked = false;

    Vector2 screen_to_world(const Vector2& s, const ViewBounds& view) const {
        return {(s.x - view.width / 2) / zoom + view.width / 2 + x,
                (s.y - view.height / 2) / zoom + view.height / 2 + y};
    }

    Vector2 world_to_screen(const Vector2& w, const ViewBounds& view) const {
        return {(w.x - x - view.width / 2) * zoom + view.width / 2,
                (w.y - y - view.height / 2) * zoom + view.height / 2};
    }
};

/// Everything one tick of the simulation reads and writes, passed
/// explicitly to every subsystem.
struct SimContext {
    EntityStore& store;
    const SimConfig& config;
    TargetingOverride& targeting;
    Economy& economy;
    std::mt19937& rng;
    const Camera& camera;
    const ViewBounds& view;
    const EnemyCatalog& catalog;
    Vector2 base_anchor;          // core ship dock, world space

    /// Uniform sample in [0, 1).
    f32 random() {
        f64 u = std::uniform_real_distribution<f64>(0.0, 1.0)(rng);
        return std::min(static_cast<f32>(u), std::nextafter(1.0f, 0.0f));
    }
};

/// Starting loadout of an encounter, precomputed outside the simulation.
struct BattleSetup {
    std::string map_id;
    UnitStatTable unit_stats;
    CoreShipStats core_ship;
    u32 marines = 0;
    u32 snipers = 0;
    u32 splayers = 0;
    u32 lasers = 0;
};

struct BattleResult {
    f32 gold_earned = 0;
    bool victory = false;
    u32 destroyed_turrets = 0;
    std::string map_id;
};

enum class BattleOutcome {
    InProgress,
    Victory,
    Defeat,
};

class SimState {
public:
    using CompletionFn = std::function<void(const BattleResult&)>;

    explicit SimState(SimConfig config = {},
                      EnemyCatalog catalog = EnemyCatalog::with_defaults(),
                      u32 seed = 0);
    ~SimState();

    SimState(const SimState&) = delete;
    SimState& operator=(const SimState&) = delete;

    // Collaborator inputs
    void set_maps(MapLibrary maps) { maps_ = std::move(maps); }
    const MapLibrary& maps() const { return maps_; }
    void set_view_bounds(const ViewBounds& view) { view_ = view; }
    void set_camera(const Camera& camera) { camera_ = camera; }
    void set_camera_locked(bool locked) { camera_.locked = locked; }

    /// HUD dock of the core ship, in screen units. Defaults to the grid
    /// origin at the bottom centre of the view.
    void set_base_anchor(const Vector2& screen) { base_anchor_ = screen; }

    void set_completion_callback(CompletionFn fn) {
        on_complete_ = std::move(fn);
    }
    void seed(u32 seed) { rng_.seed(seed); }

    /// Reset and populate a new encounter.
    void start(const BattleSetup& setup);

    /// Advance one frame. `delta` is sanitized: non-finite becomes 0 and the
    /// value is clamped to [0, max_frame_delta].
    void tick(f64 delta);

    bool active() const { return active_; }
    BattleOutcome outcome() const { return outcome_; }

    // Player commands
    bool issue_target_command(u32 enemy_id);
    void handle_command_tap(const Vector2& screen);
    void set_attack_move_waypoint(const Vector2& world);
    size_t select_units_in_rect(const Vector2& screen_a, const Vector2& screen_b);
    void clear_selection();
    TrainingResult try_start_training(size_t slot);
    bool cycle_training_slot(size_t slot);

    /// Per-tick context over this state, anchored at the current base.
    SimContext context();

    /// World position of the core ship dock under the current camera.
    Vector2 base_world_position() const;

    // Read-only views for rendering and scoring
    EntityStore& store() { return store_; }
    const EntityStore& store() const { return store_; }
    Economy& economy() { return economy_; }
    const Economy& economy() const { return economy_; }
    const TrainingQueue& training() const { return training_; }
    const TargetingOverride& targeting() const { return targeting_; }
    const Selection& selection() const { return selection_; }
    const Camera& camera() const { return camera_; }
    const ViewBounds& view_bounds() const { return view_; }
    const SimConfig& config() const { return config_; }
    const EnemyCatalog& catalog() const { return catalog_; }
    const UnitStatTable& unit_stats() const { return unit_stats_; }
    const std::string& active_map_id() const { return active_map_id_; }

    u32 tick_count() const { return tick_count_; }
    f64 game_time() const { return game_time_; }

private:
    void spawn_starting_units(MarineType type, u32 count, const UnitStats& stats,
                              SimContext& ctx);
    void build_turrets(const BattlefieldMap& map, SimContext& ctx);
    void spawn_trained_unit(const std::string& unit_id, SimContext& ctx);

    void update_marines(f64 dt, SimContext& ctx);
    void update_turrets(f64 dt, SimContext& ctx);
    void update_drones(f64 dt, SimContext& ctx);
    void reap_player_units();
    void update_camera(f64 dt);
    void check_outcome();
    void complete(bool victory);

    SimConfig config_;
    EnemyCatalog catalog_;
    MapLibrary maps_;
    EntityStore store_;
    TargetingOverride targeting_;
    Selection selection_;
    Economy economy_;
    TrainingQueue training_;
    UnitStatTable unit_stats_;
    std::mt19937 rng_;
    Camera camera_;
    ViewBounds view_;
    std::optional<Vector2> base_anchor_;
    CompletionFn on_complete_;

    std::string active_map_id_;
    bool active_ = false;
    BattleOutcome outcome_ = BattleOutcome::InProgress;
    u32 tick_count_ = 0;
    f64 game_time_ = 0.0;
};

} // namespace kuf::sim
