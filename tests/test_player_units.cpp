#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/player_units.hpp"
#include "sim/sim_config.hpp"
#include "sim_fixture.hpp"

using namespace kuf;
using namespace kuf::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Base stat blocks per archetype", "[player_units]") {
    UnitStats marines = calculate_unit_stats("marines");
    CHECK(marines.health == 10);
    CHECK(marines.attack == 1);
    CHECK(marines.attack_speed == 1);

    UnitStats snipers = calculate_unit_stats("snipers");
    CHECK(snipers.attack > marines.attack);
    CHECK(snipers.attack_speed < marines.attack_speed);

    CHECK(calculate_unit_stats("splayers").health == 12);
    CHECK(calculate_unit_stats("lasers").health == 9);
}

TEST_CASE("Shard upgrades add per-stat increments", "[player_units]") {
    UnitStats s = calculate_unit_stats("marines", UnitUpgrades{3, 2, 5});
    CHECK(s.health == 16);
    CHECK(s.attack == 2);
    CHECK_THAT(s.attack_speed, WithinAbs(1.5, 1e-5));
}

TEST_CASE("Unknown roster keys yield an empty block", "[player_units]") {
    UnitStats s = calculate_unit_stats("marine", UnitUpgrades{3, 3, 3});
    CHECK(s.health == 0);
    CHECK(s.attack == 0);
    CHECK(s.attack_speed == 0);
}

TEST_CASE("Unit type names round-trip", "[player_units]") {
    for (MarineType type : {MarineType::Marine, MarineType::Sniper,
                            MarineType::Splayer, MarineType::Laser,
                            MarineType::Worker, MarineType::DroneSupport}) {
        auto parsed = parse_marine_type(marine_type_name(type));
        REQUIRE(parsed);
        CHECK(*parsed == type);
    }
    CHECK_FALSE(parse_marine_type("tank"));
}

TEST_CASE("Stat table falls back to marines for support types",
          "[player_units]") {
    UnitStatTable table;
    table.sniper.attack = 9;
    CHECK(table.for_type(MarineType::Sniper).attack == 9);
    CHECK(&table.for_type(MarineType::Worker) == &table.marine);
    CHECK(&table.for_type(MarineType::DroneSupport) == &table.marine);
}

TEST_CASE("New units take their profile and stat block", "[player_units]") {
    SimConfig config;
    std::mt19937 rng(7);
    UnitStats stats{14, 2, 0.05f};

    auto sniper = make_player_unit(MarineType::Sniper, stats, {10, 20}, config, rng);
    CHECK(sniper->type == MarineType::Sniper);
    CHECK(sniper->x() == 10);
    CHECK(sniper->y() == 20);
    CHECK(sniper->health() == 14);
    CHECK(sniper->max_health() == 14);
    CHECK(sniper->attack == 2);
    CHECK(sniper->attack_speed == 0.1f);
    CHECK(sniper->range == config.sniper.range);
    CHECK(sniper->radius() == config.sniper.radius);
    CHECK(sniper->move_speed == config.sniper.move_speed);
    CHECK(sniper->base_move_speed == config.sniper.move_speed);
    CHECK(sniper->cooldown >= 0);
    CHECK(sniper->cooldown < 0.5f);
    CHECK(sniper->rotation_speed == 0);

    auto splayer = make_player_unit(MarineType::Splayer, stats, {}, config, rng);
    CHECK(splayer->rotation_speed == config.splayer_base_spin_speed);
    CHECK(splayer->rotation >= 0);
    CHECK(splayer->rotation < TWO_PI);
}

TEST_CASE("Created units join the store with fresh ids", "[player_units]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    Marine& a = create_player_unit(ctx, MarineType::Marine, {10, 1, 1}, {0, 0});
    Marine& b = create_player_unit(ctx, MarineType::Laser, {9, 1.5f, 0.6f}, {5, 5});
    CHECK(a.entity_id() != 0);
    CHECK(b.entity_id() > a.entity_id());
    CHECK(f.store.find_marine(b.entity_id()) == &b);
    CHECK(f.store.marines().size() == 2);
}
