#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/structures.hpp"
#include "sim_fixture.hpp"

using namespace kuf;
using namespace kuf::sim;
using Catch::Matchers::WithinAbs;

namespace {

Turret& armed_mine(test::SimFixture& f, Vector2 at, f32 attack, u32 level) {
    Turret& mine = f.dummy(at, 1, 2);
    mine.type = "mine";
    mine.attack = attack;
    mine.level = level;
    mine.mine = MineTraits{60.0f, false};
    return mine;
}

} // namespace

TEST_CASE("Mines blast everything in radius exactly once", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& mine = armed_mine(f, {400, 300}, 5, 2);
    auto& close = f.marine({430, 300});
    auto& edge = f.marine({400, 360});
    auto& clear = f.marine({400, 361});
    auto& neighbour = f.dummy({360, 300}, 50);
    f32 full = close.max_health();

    detonate_mine(mine, ctx);
    CHECK(close.health() == full - 10);
    CHECK(edge.health() == full - 10);
    CHECK(clear.health() == full);
    CHECK(neighbour.health() == 40);
    CHECK(mine.mine->detonated);

    REQUIRE(f.store.explosions().size() == 1);
    CHECK(f.store.explosions()[0].max_radius == 60.0f);
    CHECK(f.store.explosions()[0].life == f.config.explosion_life);

    detonate_mine(mine, ctx);
    CHECK(close.health() == full - 10);
    CHECK(f.store.explosions().size() == 1);
}

TEST_CASE("Killing a mine sets off its blast before removal", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& mine = armed_mine(f, {400, 300}, 3, 1);
    auto& m = f.marine({410, 300});
    f.dummy({100, 100});
    f32 full = m.max_health();

    CHECK(reap_destroyed_turrets(ctx) == 0);
    CHECK(m.health() == full);

    mine.apply_damage(5);
    CHECK(reap_destroyed_turrets(ctx) == 1);
    CHECK(m.health() == full - 3);
    CHECK(f.store.turrets().size() == 1);
    CHECK(f.economy.gold == 0);
}

TEST_CASE("Mine blasts chain through neighbouring mines", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& first = armed_mine(f, {100, 300}, 5, 1);
    armed_mine(f, {150, 300}, 5, 1);
    armed_mine(f, {200, 300}, 5, 1);
    armed_mine(f, {400, 300}, 5, 1); // out of reach
    auto& m = f.marine({250, 300});
    f32 full = m.max_health();

    first.apply_damage(1);
    CHECK(reap_destroyed_turrets(ctx) == 3);
    CHECK(f.store.turrets().size() == 1);
    CHECK(f.store.explosions().size() == 3);
    CHECK(m.health() == full - 5);
}

TEST_CASE("Explosion rings grow and fade", "[structures]") {
    test::SimFixture f;
    Explosion e;
    e.max_radius = 60;
    e.life = 0.5f;
    e.max_life = 0.5f;
    f.store.add_explosion(e);

    update_explosions(f.store, 0.25);
    REQUIRE(f.store.explosions().size() == 1);
    CHECK_THAT(f.store.explosions()[0].radius, WithinAbs(30.0, 1e-4));

    update_explosions(f.store, 0.25);
    CHECK(f.store.explosions().empty());
}

TEST_CASE("Barracks wait for a target inside spawn range", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& barracks = f.enemy("melee_barracks", {400, 100});
    auto& m = f.marine({400, 500});

    update_barracks(barracks, ctx, 0.1);
    CHECK(f.store.turrets().size() == 1);

    m.set_position({400, 200});
    update_barracks(barracks, ctx, 0.1);
    REQUIRE(f.store.turrets().size() == 2);
    const Turret& spawned = *f.store.turrets()[1];
    CHECK(spawned.type == "melee_unit");
    CHECK(spawned.level == barracks.level);
    CHECK_THAT(distance(spawned.position(), barracks.position()),
               WithinAbs(barracks.radius() + f.config.barracks_spawn_offset, 1e-3));
    CHECK(barracks.barracks->current_spawns == 1);
    CHECK(barracks.barracks->spawn_timer == barracks.barracks->spawn_cooldown);

    // Cooling down
    update_barracks(barracks, ctx, 0.1);
    CHECK(f.store.turrets().size() == 2);
}

TEST_CASE("Damaged barracks answer attackers at any distance", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& barracks = f.enemy("ranged_barracks", {400, 100});
    f.marine({400, 900});

    barracks.apply_damage(1);
    update_barracks(barracks, ctx, 0.1);
    REQUIRE(f.store.turrets().size() == 2);
    CHECK(f.store.turrets()[1]->type == "ranged_unit");
}

TEST_CASE("Barracks stop at their spawn cap", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& barracks = f.enemy("melee_barracks", {400, 100});
    f.marine({400, 150});
    u32 cap = barracks.barracks->max_spawns;

    for (int i = 0; i < 200; i++)
        update_barracks(barracks, ctx, 0.5);

    CHECK(barracks.barracks->current_spawns == cap);
    CHECK(f.store.turrets().size() == 1 + cap);
}

TEST_CASE("Support drones approach and heal damaged allies", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& healer = f.enemy("support_drone", {400, 100});
    auto& hurt = f.enemy("big_turret", {400, 300});
    hurt.apply_damage(10);

    update_support(healer, ctx, 0.5);
    CHECK_THAT(healer.y(), WithinAbs(100 + healer.mobile->move_speed * 0.5, 1e-3));
    CHECK(healer.support->heal_target_id == 0);
    CHECK(hurt.health() == hurt.max_health() - 10);

    healer.set_position({400, 260});
    update_support(healer, ctx, 0.5);
    CHECK_THAT(hurt.health(),
               WithinAbs(hurt.max_health() - 10 + healer.support->heal_per_second * 0.5,
                         1e-4));
    CHECK(healer.support->heal_target_id == hurt.entity_id());
    CHECK(healer.support->heal_visual_timer == f.config.support_heal_visual);
    REQUIRE(healer.support->active_heal_target.has_value());
    CHECK(healer.support->active_heal_target->y == 300);
}

TEST_CASE("Support drones idle with nobody to heal", "[structures]") {
    test::SimFixture f;
    auto ctx = f.ctx();
    auto& healer = f.enemy("support_drone", {400, 100});
    healer.apply_damage(1); // never heals itself
    f.enemy("big_turret", {400, 300});

    update_support(healer, ctx, 0.5);
    CHECK(healer.y() == 100);
    CHECK(healer.health() == healer.max_health() - 1);
}
