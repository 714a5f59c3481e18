#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/battlefield_loader.hpp"
#include "sim/sim_state.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>

namespace {

struct RunOptions {
    kuf::fs::path data_dir = "data";
    std::string map_id;
    kuf::u32 ticks = 3600;      // one minute at 60 Hz
    kuf::f64 dt = 1.0 / 60.0;
    kuf::u32 seed = 1;
    kuf::u32 marines = 6;
    kuf::u32 snipers = 2;
    kuf::u32 splayers = 1;
    kuf::u32 lasers = 1;
    kuf::fs::path log_file = "kufsim.log";
    bool verbose = false;
};

void print_usage() {
    std::cout << "kufsim v0.1.0\n"
              << "Headless runner for the Kuf tactical combat simulation\n\n"
              << "Usage:\n"
              << "  kufsim [options]\n\n"
              << "Options:\n"
              << "  --data <dir>       Directory of battlefield/tuning scripts (default: data)\n"
              << "  --map <id>         Battlefield id (default: first registered)\n"
              << "  --ticks <n>        Maximum number of ticks to run (default: 3600)\n"
              << "  --dt <seconds>     Frame delta per tick (default: 1/60)\n"
              << "  --seed <n>         Random seed (default: 1)\n"
              << "  --marines <n>      Pre-placed marines (default: 6)\n"
              << "  --snipers <n>      Pre-placed snipers (default: 2)\n"
              << "  --splayers <n>     Pre-placed splayers (default: 1)\n"
              << "  --lasers <n>       Pre-placed lasers (default: 1)\n"
              << "  --log <file>       Log file (default: kufsim.log)\n"
              << "  --verbose          Log per-event detail\n"
              << "  --help             Show this help message\n";
}

std::optional<kuf::u32> parse_count(const char* flag, const char* text,
                                    long max) {
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || val < 0 || val > max) {
        std::cerr << "Invalid " << flag << " value: " << text << "\n";
        return std::nullopt;
    }
    return static_cast<kuf::u32>(val);
}

std::optional<RunOptions> parse_args(int argc, char* argv[]) {
    RunOptions opts;
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        auto count_arg = [&](const char* flag, kuf::u32& out, long max) {
            if (std::strcmp(arg, flag) != 0) return false;
            if (!has_value) {
                std::cerr << flag << " requires a value\n";
                std::exit(1);
            }
            auto val = parse_count(flag, argv[++i], max);
            if (!val) std::exit(1);
            out = *val;
            return true;
        };

        if (std::strcmp(arg, "--help") == 0) {
            print_usage();
            return std::nullopt;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(arg, "--data") == 0 && has_value) {
            opts.data_dir = argv[++i];
        } else if (std::strcmp(arg, "--map") == 0 && has_value) {
            opts.map_id = argv[++i];
        } else if (std::strcmp(arg, "--log") == 0 && has_value) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(arg, "--dt") == 0 && has_value) {
            char* end = nullptr;
            double val = std::strtod(argv[++i], &end);
            if (end == argv[i] || *end != '\0' || !(val > 0)) {
                std::cerr << "Invalid --dt value: " << argv[i] << "\n";
                std::exit(1);
            }
            opts.dt = val;
        } else if (count_arg("--ticks", opts.ticks, 10'000'000) ||
                   count_arg("--seed", opts.seed, 2'147'483'647) ||
                   count_arg("--marines", opts.marines, 500) ||
                   count_arg("--snipers", opts.snipers, 500) ||
                   count_arg("--splayers", opts.splayers, 500) ||
                   count_arg("--lasers", opts.lasers, 500)) {
            continue;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(1);
        }
    }
    return opts;
}

void log_status(const kuf::sim::SimState& sim) {
    const auto& store = sim.store();
    const auto* ship = store.core_ship();
    spdlog::info("t={:.1f}s  units={} drones={} enemies={} shots={}  "
                 "hull={:.0f} shield={:.0f}  gold={:.0f} kills={}",
                 sim.game_time(), store.marines().size(), store.drones().size(),
                 store.turrets().size(), store.projectiles().size(),
                 ship ? ship->health() : 0.0f, ship ? ship->shield : 0.0f,
                 sim.economy().gold, sim.economy().destroyed_turrets);
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) return 0;

    kuf::log::init(opts->log_file,
                   opts->verbose ? spdlog::level::debug : spdlog::level::info);

    kuf::lua::BattlefieldLoader loader;
    auto data = loader.load(opts->data_dir);
    if (!data) {
        spdlog::error("Data loading failed: {}", data.error().message);
        kuf::log::shutdown();
        return 1;
    }

    kuf::sim::SimState sim(data.value().config, data.value().catalog, opts->seed);
    sim.set_maps(data.value().maps);

    std::optional<kuf::sim::BattleResult> result;
    sim.set_completion_callback(
        [&result](const kuf::sim::BattleResult& r) { result = r; });

    kuf::sim::BattleSetup setup;
    setup.map_id = opts->map_id;
    setup.marines = opts->marines;
    setup.snipers = opts->snipers;
    setup.splayers = opts->splayers;
    setup.lasers = opts->lasers;
    sim.start(setup);

    const kuf::u32 report_every = std::max<kuf::u32>(
        1, static_cast<kuf::u32>(5.0 / opts->dt));
    for (kuf::u32 i = 0; i < opts->ticks && sim.active(); i++) {
        // Keep the worker slot and the first combat slot training
        size_t slots = std::min<size_t>(2, sim.training().slots().size());
        for (size_t slot = 0; slot < slots; slot++) {
            auto plan = sim.training().spec_for_slot(slot, sim.economy(),
                                                     sim.config());
            if (plan && !sim.training().slots()[slot].is_training &&
                sim.economy().gold >= plan->cost) {
                auto started = sim.try_start_training(slot);
                if (!started.success) {
                    spdlog::debug("Training slot {}: {}", slot, started.message);
                }
            }
        }
        sim.tick(opts->dt);
        if (sim.tick_count() % report_every == 0) log_status(sim);
    }

    log_status(sim);
    if (result) {
        spdlog::info("Result: {} on '{}', {} turrets destroyed, {:.0f} gold",
                     result->victory ? "VICTORY" : "DEFEAT", result->map_id,
                     result->destroyed_turrets, result->gold_earned);
    } else {
        spdlog::info("Battle still in progress after {} ticks", sim.tick_count());
    }

    kuf::log::shutdown();
    return 0;
}
