#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/core_ship.hpp"
#include "sim_fixture.hpp"

#include <cmath>

using namespace kuf;
using namespace kuf::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Core ship stats derive from allocated upgrades", "[core_ship]") {
    SimConfig config;
    CoreShipStats stats;
    stats.health = 200;
    stats.shield = 2;
    stats.drone_rate = 3;
    stats.drone_health = 2;
    stats.drone_damage = 2;
    stats.cannons = 4;
    stats.scale = 1.5f;

    CoreShip ship = make_core_ship(stats, {100, 500}, config);
    CHECK(ship.max_health() == 200);
    CHECK(ship.health() == 200);
    CHECK(ship.max_shield == 100);
    CHECK(ship.shield == 0);
    CHECK(ship.shield_regen_rate == 9);
    CHECK(ship.shield_regen_delay == config.core_ship.shield_regen_delay);
    CHECK(ship.drone_spawn_rate == 3.5f);
    CHECK(ship.drone_health == 20);
    CHECK(ship.drone_damage == 2);
    CHECK(ship.cannons == 4);
    CHECK_THAT(ship.radius(), WithinAbs(18 * 0.6 * 1.5, 1e-4));
    CHECK(ship.x() == 100);
    CHECK(ship.y() == 500);
}

TEST_CASE("Core ship stat edge cases", "[core_ship]") {
    SimConfig config;
    CoreShipStats stats;
    stats.health = 0;
    stats.drone_rate = 20;
    stats.level = 0;
    stats.scale = 0;

    CoreShip ship = make_core_ship(stats, {}, config);
    CHECK(ship.max_health() == 1);
    CHECK(ship.drone_spawn_rate == 0.5f);
    CHECK(ship.max_shield == 0);
    CHECK(ship.level == 1);
    CHECK(ship.scale == 1.0f);

    CoreShip idle = make_core_ship(CoreShipStats{}, {}, config);
    CHECK(idle.drone_spawn_rate == 0);
    CHECK(idle.drone_health == 10);
    CHECK(idle.drone_damage == 1);
}

TEST_CASE("Hits drain the shield before the hull", "[core_ship]") {
    test::SimFixture f;
    CoreShipStats stats;
    stats.shield = 2;
    auto& ship = f.core_ship(stats);
    ship.shield = ship.max_shield;
    f32 hull = ship.health();

    ship.absorb_hit(30);
    CHECK(ship.shield == 70);
    CHECK(ship.health() == hull);
    CHECK_FALSE(ship.shield_broken);

    ship.absorb_hit(80);
    CHECK(ship.shield == 0);
    CHECK(ship.shield_broken);
    CHECK(ship.health() == hull);

    ship.absorb_hit(5);
    CHECK(ship.health() == hull - 5);
}

TEST_CASE("A broken shield regenerates only after a quiet delay",
          "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    CoreShipStats stats;
    stats.shield = 2;
    auto& ship = f.core_ship(stats);
    ship.shield = 10;
    ship.absorb_hit(10);
    REQUIRE(ship.shield_broken);

    ship.update(1.0, ctx);
    ship.update(1.0, ctx);
    CHECK(ship.shield == 0);

    // Any hit restarts the delay
    ship.absorb_hit(1);
    CHECK(ship.shield_regen_timer == 0);
    ship.update(1.0, ctx);
    ship.update(1.0, ctx);
    CHECK(ship.shield == 0);
    ship.update(1.0, ctx);
    CHECK(ship.shield == ship.shield_regen_rate);

    // Stays broken, and keeps passing hits to the hull, until full
    CHECK(ship.shield_broken);
    f32 hull = ship.health();
    ship.absorb_hit(2);
    CHECK(ship.health() == hull - 2);
    CHECK(ship.shield == ship.shield_regen_rate);

    for (int i = 0; i < 40 && ship.shield_broken; i++)
        ship.update(0.5, ctx);
    CHECK_FALSE(ship.shield_broken);
    CHECK(ship.shield == ship.max_shield);
}

TEST_CASE("The core ship stays docked to the base anchor", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& ship = f.core_ship();
    ship.set_position({0, 0});
    ctx.base_anchor = {320, 500};

    ship.update(0.1, ctx);
    CHECK(ship.x() == 320);
    CHECK(ship.y() == 500);
}

TEST_CASE("Hull repair heals on its own cadence", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    CoreShipStats stats;
    stats.hull_repair = 10;
    auto& ship = f.core_ship(stats);
    ship.apply_damage(20);
    f32 hurt = ship.health();

    ship.update(0.1, ctx);
    CHECK_THAT(ship.health(), WithinAbs(hurt + 1.0, 1e-4));
    CHECK(ship.hull_repair_cooldown == f.config.core_ship.repair_interval);

    ship.update(0.05, ctx);
    CHECK_THAT(ship.health(), WithinAbs(hurt + 1.0, 1e-4));
}

TEST_CASE("The healing aura mends nearby marines", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    CoreShipStats stats;
    stats.healing_aura = 5;
    f.core_ship(stats);
    auto& near = f.marine({400, 500});
    auto& far = f.marine({400, 100});
    near.apply_damage(4);
    far.apply_damage(4);

    f.store.core_ship()->update(0.1, ctx);
    CHECK_THAT(near.health(), WithinAbs(near.max_health() - 4 + 0.5, 1e-4));
    CHECK(far.health() == far.max_health() - 4);
}

TEST_CASE("The healing aura never revives a dead marine", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    CoreShipStats stats;
    stats.healing_aura = 5;
    f.core_ship(stats);
    auto& dead = f.marine({400, 530});
    dead.apply_damage(1000);

    f.store.core_ship()->update(0.1, ctx);
    CHECK(dead.health() == 0);
    CHECK_FALSE(dead.alive());

    dead.heal(5);
    CHECK(dead.health() == 0);
}

TEST_CASE("Drones launch on the spawn interval", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    CoreShipStats stats;
    stats.drone_rate = 8;
    stats.drone_health = 1;
    auto& ship = f.core_ship(stats);

    ship.update(0.5, ctx);
    CHECK(f.store.drones().empty());
    ship.update(0.5, ctx);
    REQUIRE(f.store.drones().size() == 1);

    const Drone& d = *f.store.drones()[0];
    CHECK(d.max_health() == 15);
    CHECK(d.attack == 1);
    CHECK_THAT(distance(d.position(), ship.position()),
               WithinAbs(ship.radius() + f.config.core_ship.drone_spawn_offset, 1e-3));
    CHECK(ship.drone_spawn_timer == 0);
}

TEST_CASE("Drones close on turrets and fire in range", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& d = f.drone({400, 500});
    auto& t = f.dummy({400, 100});

    d.update(1.0, ctx);
    CHECK_THAT(d.y(), WithinAbs(500 - d.move_speed, 1e-3));
    CHECK(f.store.projectiles().empty());

    d.set_position({400, 200});
    d.update(0.1, ctx);
    REQUIRE(f.store.projectiles().size() == 1);
    CHECK(f.store.projectiles()[0]->type == "drone");
    CHECK(f.store.projectiles()[0]->player_owned());
    CHECK_THAT(d.cooldown, WithinAbs(1.0 / d.attack_speed, 1e-5));
    (void)t;
}

TEST_CASE("Cannons fan a volley at the nearest turret", "[core_ship]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    CoreShipStats stats;
    stats.cannons = 3;
    auto& ship = f.core_ship(stats);

    ship.update(0.1, ctx);
    CHECK(f.store.projectiles().empty());

    f.dummy({ship.x(), ship.y() - 150});
    ship.update(0.1, ctx);
    REQUIRE(f.store.projectiles().size() == 3);
    for (const auto& p : f.store.projectiles())
        CHECK(p->owner == ProjectileOwner::CoreShip);
    f32 spread = f.config.core_ship.cannon_spread;
    CHECK_THAT(std::atan2(f.store.projectiles()[0]->velocity.y,
                          f.store.projectiles()[0]->velocity.x),
               WithinAbs(-PI / 2 - spread / 2, 1e-4));

    ship.update(0.1, ctx);
    CHECK(f.store.projectiles().size() == 3);
}
