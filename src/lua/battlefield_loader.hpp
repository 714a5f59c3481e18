#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/battlefield.hpp"
#include "sim/enemy_catalog.hpp"
#include "sim/sim_config.hpp"

#include <string_view>

namespace kuf::blueprints {
class BlueprintStore;
}

namespace kuf::lua {

class LuaState;

/// Everything the data scripts produce for a run.
struct BattleData {
    sim::SimConfig config;
    sim::EnemyCatalog catalog = sim::EnemyCatalog::with_defaults();
    sim::MapLibrary maps;
};

class BattlefieldLoader {
public:
    /// Execute every *.lua file in `data_dir`, in file name order.
    /// Returns the number of scripts run.
    Result<size_t> run_scripts(LuaState& state, const fs::path& data_dir);

    /// Convert Enemy blueprints into archetypes. A blueprint naming a known
    /// type only overrides the fields it sets; new types must set Radius and
    /// Health.
    Result<size_t> load_enemies(const blueprints::BlueprintStore& store,
                                sim::EnemyCatalog& catalog);

    /// Convert Battlefield blueprints into maps, in registration order.
    /// Layout entries naming types absent from `catalog` are kept (and
    /// skipped at spawn) with a warning.
    Result<size_t> load_maps(const blueprints::BlueprintStore& store,
                             const sim::EnemyCatalog& catalog,
                             sim::MapLibrary& maps);

    /// Apply the global KufTuning table, if the scripts defined one.
    /// Returns whether a table was found.
    Result<bool> load_tuning(LuaState& state, sim::SimConfig& config);

    /// Run all scripts of `data_dir` in a fresh state and convert the result.
    /// Fails if no battlefield was registered.
    Result<BattleData> load(const fs::path& data_dir);

    /// Same as load() over an inline script; used by tools and tests.
    Result<BattleData> load_string(std::string_view script);

private:
    Result<BattleData> convert(LuaState& state,
                               const blueprints::BlueprintStore& store);
};

} // namespace kuf::lua
