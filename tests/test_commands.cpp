#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/commands.hpp"
#include "sim_fixture.hpp"

using namespace kuf;
using namespace kuf::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Formation lattice is centred and spaced by unit size", "[commands]") {
    test::SimFixture f;
    std::vector<Marine*> units;
    for (int i = 0; i < 5; i++)
        units.push_back(&f.marine({0, 0}));
    f32 spacing = units[0]->radius() * 4;

    auto points = formation_waypoints(units, {100, 100});
    REQUIRE(points.size() == 5);
    // 3 columns, 2 rows
    CHECK_THAT(points[0].x, WithinAbs(100 - spacing, 1e-4));
    CHECK_THAT(points[0].y, WithinAbs(100 - spacing / 2, 1e-4));
    CHECK_THAT(points[2].x, WithinAbs(100 + spacing, 1e-4));
    CHECK_THAT(points[3].x, WithinAbs(100 - spacing, 1e-4));
    CHECK_THAT(points[3].y, WithinAbs(100 + spacing / 2, 1e-4));

    auto single = formation_waypoints({units[0]}, {7, 8});
    REQUIRE(single.size() == 1);
    CHECK(single[0].x == 7);
    CHECK(single[0].y == 8);

    auto none = formation_waypoints({}, {7, 8});
    REQUIRE(none.size() == 1);
    CHECK(none[0].x == 7);
}

TEST_CASE("Formation spacing follows the largest unit", "[commands]") {
    test::SimFixture f;
    std::vector<Marine*> units{&f.marine({0, 0}),
                               &f.marine({0, 0}, MarineType::Splayer)};
    auto points = formation_waypoints(units, {0, 0});
    REQUIRE(points.size() == 2);
    CHECK_THAT(points[1].x - points[0].x,
               WithinAbs(f.config.splayer.radius * 4, 1e-4));
    CHECK(points[0].y == points[1].y);
}

TEST_CASE("Targeting an enemy focuses fire and drops waypoints", "[commands]") {
    test::SimFixture f;
    Selection selection;
    auto& m = f.marine({100, 400});
    m.waypoint = Vector2{100, 300};
    selection.attack_move_waypoint = Vector2{100, 300};
    auto& t = f.dummy({100, 100});

    CHECK(issue_target_command(f.store, f.targeting, selection, t.entity_id()));
    CHECK(f.targeting.focused_enemy_id == t.entity_id());
    CHECK_FALSE(m.waypoint.has_value());
    CHECK_FALSE(selection.attack_move_waypoint.has_value());

    CHECK_FALSE(issue_target_command(f.store, f.targeting, selection, m.entity_id()));
    CHECK_FALSE(issue_target_command(f.store, f.targeting, selection, 999));
    t.apply_damage(100);
    CHECK_FALSE(issue_target_command(f.store, f.targeting, selection, t.entity_id()));
}

TEST_CASE("Attack-move orders only the selected units", "[commands]") {
    test::SimFixture f;
    Selection selection;
    auto& a = f.marine({100, 400});
    auto& b = f.marine({200, 400});

    set_attack_move_waypoint(f.store, selection, {150, 200});
    CHECK(a.waypoint.has_value());
    CHECK(b.waypoint.has_value());
    REQUIRE(selection.attack_move_waypoint);
    CHECK(selection.attack_move_waypoint->y == 200);

    a.waypoint.reset();
    b.waypoint.reset();
    selection.unit_ids = {b.entity_id(), 12345};
    set_attack_move_waypoint(f.store, selection, {150, 200});
    CHECK_FALSE(a.waypoint.has_value());
    REQUIRE(b.waypoint.has_value());
    CHECK(b.waypoint->x == 150);
    CHECK(b.waypoint->y == 200);
}

TEST_CASE("Taps focus an enemy or move to open ground", "[commands]") {
    test::SimFixture f;
    Selection selection;
    auto& m = f.marine({100, 400});
    auto& t = f.dummy({100, 100}, 10, 4);

    handle_command_tap(f.store, f.targeting, selection, {107, 100},
                       f.config.enemy_tap_padding);
    CHECK(f.targeting.focused_enemy_id == t.entity_id());
    CHECK_FALSE(m.waypoint.has_value());

    handle_command_tap(f.store, f.targeting, selection, {300, 300},
                       f.config.enemy_tap_padding);
    CHECK_FALSE(f.targeting.active());
    REQUIRE(m.waypoint.has_value());
    CHECK(m.waypoint->x == 300);
}

TEST_CASE("Rectangle selection works in screen space", "[commands]") {
    test::SimFixture f;
    Selection selection;
    auto& a = f.marine({100, 100});
    auto& b = f.marine({150, 120});
    f.marine({400, 400});

    CHECK(select_units_in_rect(f.store, selection, f.camera, f.view, {160, 130},
                               {90, 90}) == 2);
    CHECK(selection.unit_ids == std::vector<u32>{a.entity_id(), b.entity_id()});

    // Scrolled view: the same screen rectangle now covers other world points
    f.camera.y = 300;
    CHECK(select_units_in_rect(f.store, selection, f.camera, f.view, {90, 90},
                               {160, 130}) == 0);
    CHECK(select_units_in_rect(f.store, selection, f.camera, f.view, {390, 90},
                               {410, 110}) == 1);

    f.targeting.focus(a.entity_id());
    selection.attack_move_waypoint = Vector2{1, 1};
    clear_selection(selection, f.targeting);
    CHECK(selection.unit_ids.empty());
    CHECK_FALSE(selection.attack_move_waypoint.has_value());
    CHECK_FALSE(f.targeting.active());
}
