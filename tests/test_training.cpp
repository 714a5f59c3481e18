#include <catch2/catch_test_macros.hpp>
#include "sim/sim_config.hpp"
#include "sim/training.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace kuf;
using namespace kuf::sim;

TEST_CASE("Economy spending rules", "[training]") {
    Economy economy;
    economy.gold = 10;
    CHECK(economy.spend(4));
    CHECK(economy.gold == 6);
    CHECK_FALSE(economy.spend(7));
    CHECK(economy.gold == 6);
    CHECK_FALSE(economy.spend(-1));
    CHECK_FALSE(economy.spend(std::numeric_limits<f32>::quiet_NaN()));
    CHECK_FALSE(economy.spend(std::numeric_limits<f32>::infinity()));
    CHECK(economy.spend(6));
    CHECK(economy.gold == 0);
}

TEST_CASE("Workers raise the per-kill income", "[training]") {
    Economy economy;
    economy.award_kill(5);
    CHECK(economy.gold == 6);
    economy.hire_worker();
    economy.award_kill(5);
    CHECK(economy.gold == 13);
    CHECK(economy.destroyed_turrets == 2);
    CHECK(economy.worker_count == 1);
}

TEST_CASE("Queue reset lays out the default toolbar", "[training]") {
    SimConfig config;
    TrainingQueue queue;
    queue.reset(config);

    REQUIRE(queue.slots().size() == 4);
    CHECK(queue.slots()[0].unit_id == "worker");
    CHECK_FALSE(queue.slots()[0].equipable);
    CHECK(queue.slots()[1].unit_id == "marine");
    CHECK(queue.slots()[1].equipable);
    CHECK(queue.slots()[3].unit_id == "splayer");
    CHECK(queue.slots()[3].slot_id == 3);
}

TEST_CASE("Worker cost escalates with the workforce", "[training]") {
    SimConfig config;
    TrainingQueue queue;
    queue.reset(config);
    Economy economy;

    std::vector<f32> costs;
    for (int i = 0; i < 3; i++) {
        auto plan = queue.spec_for_slot(0, economy, config);
        REQUIRE(plan);
        costs.push_back(plan->cost);
        economy.hire_worker();
    }
    CHECK(costs == std::vector<f32>{2, 4, 6});

    auto marine = queue.spec_for_slot(1, economy, config);
    REQUIRE(marine);
    CHECK(marine->cost == 15);
    CHECK(marine->label == "Marine");
    CHECK_FALSE(queue.spec_for_slot(9, economy, config));
}

TEST_CASE("Starting training checks gold and busy slots", "[training]") {
    SimConfig config;
    TrainingQueue queue;
    queue.reset(config);
    Economy economy;
    economy.gold = 20;

    TrainingResult poor = queue.try_start(2, economy, config);
    CHECK_FALSE(poor.success);
    CHECK(poor.message == "Not enough gold");
    CHECK(economy.gold == 20);

    TrainingResult ok = queue.try_start(1, economy, config);
    CHECK(ok.success);
    CHECK(ok.message == "Training Marine");
    CHECK(economy.gold == 5);
    CHECK(queue.slots()[1].is_training);

    economy.gold = 100;
    CHECK_FALSE(queue.try_start(1, economy, config).success);
    CHECK(economy.gold == 100);
    CHECK_FALSE(queue.try_start(7, economy, config).success);
}

TEST_CASE("Equipable slots cycle through the roster", "[training]") {
    SimConfig config;
    TrainingQueue queue;
    queue.reset(config);

    CHECK_FALSE(queue.cycle_slot(0, config));
    CHECK(queue.slots()[0].unit_id == "worker");

    CHECK(queue.cycle_slot(3, config));
    CHECK(queue.slots()[3].unit_id == "laser");
    CHECK(queue.cycle_slot(3, config));
    CHECK(queue.slots()[3].unit_id == "marine");

    Economy economy;
    economy.gold = 100;
    REQUIRE(queue.try_start(3, economy, config).success);
    CHECK_FALSE(queue.cycle_slot(3, config));
}

TEST_CASE("Finished training spawns exactly once", "[training]") {
    SimConfig config;
    TrainingQueue queue;
    queue.reset(config);
    Economy economy;
    economy.gold = 100;
    REQUIRE(queue.try_start(0, economy, config).success);
    REQUIRE(queue.try_start(1, economy, config).success);

    std::vector<std::string> spawned;
    auto spawn = [&](const std::string& id) { spawned.push_back(id); };

    queue.update(2.0, economy, config, spawn);
    CHECK(spawned.empty());
    CHECK(queue.slots()[0].progress == 2.0f);

    queue.update(1.0, economy, config, spawn);
    CHECK(spawned == std::vector<std::string>{"worker"});
    CHECK_FALSE(queue.slots()[0].is_training);
    CHECK(queue.slots()[0].progress == 0);

    queue.update(2.0, economy, config, spawn);
    CHECK(spawned == std::vector<std::string>{"worker", "marine"});

    queue.update(10.0, economy, config, spawn);
    CHECK(spawned.size() == 2);
}
