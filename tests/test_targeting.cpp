#include <catch2/catch_test_macros.hpp>
#include "sim/targeting.hpp"
#include "sim_fixture.hpp"

using namespace kuf;
using namespace kuf::sim;

TEST_CASE("Closest turret within range", "[targeting]") {
    test::SimFixture f;
    f.dummy({300, 300});
    auto& near = f.dummy({120, 100});
    f.dummy({100, 400});

    CHECK(find_closest_turret(f.store, f.targeting, {100, 100}, 100) == &near);
    CHECK(find_closest_turret(f.store, f.targeting, {100, 100}, 10) == nullptr);
}

TEST_CASE("Equal distances resolve to the lowest id", "[targeting]") {
    test::SimFixture f;
    auto& first = f.dummy({200, 100});
    f.dummy({0, 100});

    CHECK(find_closest_turret(f.store, f.targeting, {100, 100}, 500) == &first);

    auto& m1 = f.marine({300, 300});
    f.marine({300, 100});
    CHECK(find_closest_marine(f.store, {300, 200}, 500) == &m1);
}

TEST_CASE("Focused enemy overrides distance while in range", "[targeting]") {
    test::SimFixture f;
    auto& near = f.dummy({110, 100});
    auto& far = f.dummy({250, 100});
    f.targeting.focus(far.entity_id());

    CHECK(find_closest_turret(f.store, f.targeting, {100, 100}, 200) == &far);
    // Out of range: fall back to the nearest
    CHECK(find_closest_turret(f.store, f.targeting, {100, 100}, 100) == &near);
}

TEST_CASE("Focus on a dead or removed enemy is dropped", "[targeting]") {
    test::SimFixture f;
    auto& t = f.dummy({100, 100});
    u32 id = t.entity_id();
    f.targeting.focus(id);

    CHECK(resolve_focused_enemy(f.store, f.targeting) == &t);
    CHECK(f.targeting.active());

    t.apply_damage(100);
    CHECK(resolve_focused_enemy(f.store, f.targeting) == nullptr);
    CHECK_FALSE(f.targeting.active());

    f.targeting.focus(id);
    f.store.remove_turrets_if([](const Turret&) { return true; });
    CHECK(resolve_focused_enemy(f.store, f.targeting) == nullptr);
    CHECK_FALSE(f.targeting.active());
}

TEST_CASE("Player targets: marines, drones, then the core ship", "[targeting]") {
    test::SimFixture f;
    Vector2 from{400, 300};

    CHECK(find_closest_player_target(f.store, from, 1000) == nullptr);

    auto& ship = f.core_ship();
    CHECK(find_closest_player_target(f.store, from, 1000) == &ship);
    CHECK(find_closest_player_target(f.store, from, 100) == nullptr);

    auto& drone = f.drone({400, 350});
    CHECK(find_closest_player_target(f.store, from, 1000) == &drone);

    // Same distance as the drone: the marine wins
    auto& marine = f.marine({400, 250});
    CHECK(find_closest_player_target(f.store, from, 1000) == &marine);

    ship.apply_damage(1000);
    marine.set_position({0, 0});
    drone.set_position({0, 600});
    CHECK(find_closest_player_target(f.store, from, 1000) == &marine);
}

TEST_CASE("Damaged turret search skips the healer and healthy turrets",
          "[targeting]") {
    test::SimFixture f;
    auto& healer = f.dummy({100, 100});
    healer.apply_damage(1);
    auto& healthy = f.dummy({105, 100});
    auto& hurt = f.dummy({150, 100});
    hurt.apply_damage(2);
    (void)healthy;

    CHECK(find_damaged_turret(f.store, healer.position(), 200,
                              healer.entity_id()) == &hurt);
    CHECK(find_damaged_turret(f.store, healer.position(), 20,
                              healer.entity_id()) == nullptr);
}

TEST_CASE("Enemy under a tap point", "[targeting]") {
    test::SimFixture f;
    auto& t = f.dummy({200, 200}, 10, 4);

    CHECK(find_enemy_at_point(f.store, {203, 200}, 0) == &t);
    CHECK(find_enemy_at_point(f.store, {208, 200}, 0) == nullptr);
    CHECK(find_enemy_at_point(f.store, {208, 200}, 6) == &t);
}

TEST_CASE("Dead units awaiting reaping are never targeted", "[targeting]") {
    test::SimFixture f;
    auto& corpse = f.marine({400, 320});
    auto& live = f.marine({400, 380});
    corpse.apply_damage(1000);
    REQUIRE_FALSE(corpse.alive());

    CHECK(find_closest_marine(f.store, {400, 300}, 200) == &live);
    CHECK(find_closest_player_target(f.store, {400, 300}, 200) == &live);

    auto& drone = f.drone({400, 310});
    drone.apply_damage(1000);
    CHECK(find_closest_player_target(f.store, {400, 300}, 200) == &live);

    live.apply_damage(1000);
    CHECK(find_closest_player_target(f.store, {400, 300}, 200) == nullptr);

    auto& dead_gun = f.dummy({100, 110});
    auto& gun = f.dummy({100, 150});
    dead_gun.apply_damage(100);
    CHECK(find_closest_turret(f.store, f.targeting, {100, 100}, 200) == &gun);
}
