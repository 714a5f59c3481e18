#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/movement.hpp"
#include "sim_fixture.hpp"

using namespace kuf;
using namespace kuf::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Steering accelerates per axis up to move speed", "[movement]") {
    Vector2 velocity;
    bool arrived = steer_toward(velocity, {0, 0}, {100, 0}, 70, 120, 5, 0.1);
    CHECK_FALSE(arrived);
    CHECK_THAT(velocity.x, WithinAbs(12.0, 1e-4));
    CHECK_THAT(velocity.y, WithinAbs(0.0, 1e-4));

    for (int i = 0; i < 20; i++)
        steer_toward(velocity, {0, 0}, {100, 0}, 70, 120, 5, 0.1);
    CHECK_THAT(velocity.x, WithinAbs(70.0, 1e-4));
}

TEST_CASE("Steering stops inside the arrival tolerance", "[movement]") {
    Vector2 velocity{30, -20};
    CHECK(steer_toward(velocity, {0, 0}, {3, 3}, 70, 120, 5, 0.1));
    CHECK(velocity.x == 0);
    CHECK(velocity.y == 0);
}

TEST_CASE("Advance pushes north and bleeds off sideways drift", "[movement]") {
    Vector2 velocity{5, 0};
    advance(velocity, 70, 120, 0.1);
    CHECK_THAT(velocity.y, WithinAbs(-12.0, 1e-4));
    CHECK(velocity.x == 0);

    decelerate(velocity, 120, 0.05);
    CHECK_THAT(velocity.y, WithinAbs(-6.0, 1e-4));
}

TEST_CASE("Direct approach moves at constant speed", "[movement]") {
    test::SimFixture f;
    auto& t = f.dummy({0, 0});
    f32 dist = move_directly_toward(t, {30, 40}, 10, 0.5);
    CHECK_THAT(dist, WithinAbs(50.0, 1e-4));
    CHECK_THAT(t.x(), WithinAbs(3.0, 1e-4));
    CHECK_THAT(t.y(), WithinAbs(4.0, 1e-4));

    // Already there: no movement, no division by zero
    CHECK(move_directly_toward(t, t.position(), 10, 0.5) == 0);
}

TEST_CASE("Marines without orders advance up the lane", "[movement]") {
    test::SimFixture f;
    auto& m = f.marine({400, 500});
    for (int i = 0; i < 60; i++)
        update_marine_movement(m, nullptr, f.config, 1.0 / 60.0);
    CHECK(m.y() < 500);
    CHECK_THAT(m.x(), WithinAbs(400.0, 1e-3));
}

TEST_CASE("Attack-move reaches the waypoint and clears it", "[movement]") {
    test::SimFixture f;
    auto& m = f.marine({400, 500});
    m.waypoint = Vector2{460, 500};

    for (int i = 0; i < 300 && m.waypoint; i++)
        update_marine_movement(m, nullptr, f.config, 1.0 / 60.0);

    CHECK_FALSE(m.waypoint.has_value());
    CHECK_THAT(m.x(), WithinAbs(460.0, f.config.arrival_tolerance + 1.5));
    CHECK_THAT(m.y(), WithinAbs(500.0, f.config.arrival_tolerance));
}

TEST_CASE("Focused marines hold just inside firing range", "[movement]") {
    test::SimFixture f;
    auto& m = f.marine({400, 500});
    auto& target = f.dummy({400, 100});
    f32 hold = m.range - f.config.target_hold_buffer;

    for (int i = 0; i < 600; i++)
        update_marine_movement(m, &target, f.config, 1.0 / 60.0);

    f32 dist = distance(m.position(), target.position());
    CHECK(dist <= m.range);
    CHECK_THAT(dist, WithinAbs(hold, f.config.target_hold_buffer * 2));
}
