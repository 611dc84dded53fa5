#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "client/state_rebuilder.hpp"
#include "server/state_diff.hpp"
#include "server/state_serializer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using Catch::Approx;
using namespace racesync::protocol;
using namespace racesync::server;

namespace {

CarState car(const std::string& id, double x, double z) {
    CarState c;
    c.player_id = id;
    c.x = x;
    c.z = z;
    return c;
}

MissileState missile(const std::string& id, const std::string& owner, double x) {
    MissileState m;
    m.id = id;
    m.owner_id = owner;
    m.x = x;
    m.speed = 45.0;
    return m;
}

ItemState item(const std::string& id, ItemType type, double x) {
    ItemState i;
    i.id = id;
    i.type = type;
    i.x = x;
    return i;
}

// Collection order is not part of the contract
RoomState canonical(RoomState state) {
    std::sort(state.cars.begin(), state.cars.end(),
              [](const CarState& a, const CarState& b) { return a.player_id < b.player_id; });
    std::sort(state.missiles.begin(), state.missiles.end(),
              [](const MissileState& a, const MissileState& b) { return a.id < b.id; });
    std::sort(state.items.begin(), state.items.end(),
              [](const ItemState& a, const ItemState& b) { return a.id < b.id; });
    return state;
}

RoomState make_a() {
    RoomState s;
    s.room_id = "room-1";
    s.track_id = "oval";
    s.server_time = 1.0;
    s.cars = {car("p1", 0.0, 0.0), car("p2", 10.0, 5.0), car("p3", -4.0, 2.0)};
    s.missiles = {missile("p1-m0", "p1", 3.0)};
    s.items = {item("item-0", ItemType::Nitro, 20.0), item("item-1", ItemType::Shoot, 30.0)};
    return s;
}

RoomState make_b() {
    RoomState s = make_a();
    s.server_time = 1.05;
    s.cars[0].x = 1.5;
    s.cars[0].turbo_active = true;
    s.cars.erase(s.cars.begin() + 2);
    s.cars.insert(s.cars.begin(), car("p4", 7.0, 7.0));
    s.missiles.clear();
    s.missiles.push_back(missile("p2-m0", "p2", 11.0));
    s.items.erase(s.items.begin());
    s.items.push_back(item("item-2", ItemType::Nitro, 40.0));
    s.radio = RadioState{true, 1};
    s.race.players.push_back(RacePlayer{});
    return s;
}

} // namespace

TEST_CASE("compute_state_delta round trip") {
    RoomState a = make_a();
    RoomState b = make_b();

    auto delta = compute_state_delta(a, b);
    REQUIRE(delta.has_value());

    auto rebuilt = racesync::client::apply_room_state_delta(&a, *delta);
    REQUIRE(rebuilt.has_value());
    REQUIRE(canonical(*rebuilt) == canonical(b));
}

TEST_CASE("compute_state_delta emits minimal patches") {
    RoomState a = make_a();
    RoomState b = a;
    b.cars[1].x = 11.0;

    auto delta = compute_state_delta(a, b);
    REQUIRE(delta.has_value());
    REQUIRE(delta->cars.has_value());
    REQUIRE(delta->cars->added.empty());
    REQUIRE(delta->cars->removed.empty());
    REQUIRE(delta->cars->updated.size() == 1);

    const CarPatch& patch = delta->cars->updated[0];
    REQUIRE(patch.player_id == "p2");
    REQUIRE(patch.x.has_value());
    REQUIRE(*patch.x == Approx(11.0));
    REQUIRE_FALSE(patch.z.has_value());
    REQUIRE_FALSE(patch.speed.has_value());

    REQUIRE_FALSE(delta->missiles.has_value());
    REQUIRE_FALSE(delta->items.has_value());
    REQUIRE_FALSE(delta->radio.has_value());
    REQUIRE(delta->room_id == std::optional<std::string>("room-1"));
}

TEST_CASE("compute_state_delta identical states") {
    RoomState a = make_a();
    REQUIRE_FALSE(compute_state_delta(a, a).has_value());
}

TEST_CASE("compute_state_delta sends changed items as remove plus add") {
    RoomState a = make_a();
    RoomState b = a;
    b.items[0].type = ItemType::Shoot;

    auto delta = compute_state_delta(a, b);
    REQUIRE(delta.has_value());
    REQUIRE(delta->items.has_value());
    REQUIRE(delta->items->removed == std::vector<std::string>{"item-0"});
    REQUIRE(delta->items->added.size() == 1);
    REQUIRE(delta->items->added[0].type == ItemType::Shoot);
}

TEST_CASE("has_broadcastable_changes") {
    RoomState a = make_a();

    SECTION("server time alone is not worth a broadcast") {
        RoomState b = a;
        b.server_time += 0.5;
        auto delta = compute_state_delta(a, b);
        REQUIRE(delta.has_value());
        REQUIRE_FALSE(has_broadcastable_changes(*delta));
    }

    SECTION("radio changes are") {
        RoomState b = a;
        b.radio.enabled = true;
        auto delta = compute_state_delta(a, b);
        REQUIRE(delta.has_value());
        REQUIRE(has_broadcastable_changes(*delta));
        REQUIRE(count_changes(*delta) == 1);
    }
}

TEST_CASE("should_send_full_snapshot heuristic") {
    RoomState a;
    a.room_id = "room-1";
    for (int i = 0; i < 10; ++i) {
        a.cars.push_back(car("p" + std::to_string(i), i, 0.0));
    }

    SECTION("few changes stay a delta") {
        RoomState b = a;
        b.cars[0].x = 100.0;
        auto delta = compute_state_delta(a, b);
        REQUIRE(delta.has_value());
        REQUIRE_FALSE(should_send_full_snapshot(*delta, a, b));
    }

    SECTION("ratio above the threshold goes full") {
        RoomState b = a;
        for (int i = 0; i < 6; ++i) {
            b.cars[i].x += 1.0;
        }
        auto delta = compute_state_delta(a, b);
        REQUIRE(delta.has_value());
        REQUIRE(count_changes(*delta) == 6);
        REQUIRE(should_send_full_snapshot(*delta, a, b));
    }

    SECTION("absolute change count goes full") {
        RoomState b = a;
        for (int i = 0; i < 3; ++i) {
            b.cars[i].x += 1.0;
        }
        auto delta = compute_state_delta(a, b);
        REQUIRE(delta.has_value());
        DeltaThresholds thresholds;
        thresholds.max_ratio = 1.0;
        thresholds.min_changes = 3;
        REQUIRE(should_send_full_snapshot(*delta, a, b, thresholds));
        thresholds.min_changes = 4;
        REQUIRE_FALSE(should_send_full_snapshot(*delta, a, b, thresholds));
    }

    SECTION("empty rooms use a total of one") {
        RoomState empty;
        RoomState b = empty;
        b.radio.enabled = true;
        auto delta = compute_state_delta(empty, b);
        REQUIRE(delta.has_value());
        REQUIRE(should_send_full_snapshot(*delta, empty, b));
    }
}

TEST_CASE("round_number") {
    REQUIRE(round_number(1.23456, 3) == Approx(1.235));
    REQUIRE(round_number(-1.2344, 3) == Approx(-1.234));
    REQUIRE(round_number(2.5, 0) == Approx(2.5));
    REQUIRE(round_number(std::numeric_limits<double>::infinity(), 3) == 0.0);
    REQUIRE(round_number(std::nan(""), 3) == 0.0);
}

TEST_CASE("serialize_room_state rounds continuous fields") {
    RoomState s;
    s.server_time = 1.00049;
    CarState c = car("p1", 1.00001, 2.99999);
    c.turbo_charges = 2;
    s.cars.push_back(c);
    s.missiles.push_back(missile("m", "p1", 0.1234567));
    s.race.countdown_remaining = 2.71828;

    RoomState out = serialize_room_state(s, 3);
    REQUIRE(out.server_time == Approx(1.0));
    REQUIRE(out.cars[0].x == Approx(1.0));
    REQUIRE(out.cars[0].z == Approx(3.0));
    REQUIRE(out.cars[0].turbo_charges == 2);
    REQUIRE(out.missiles[0].x == Approx(0.123));
    REQUIRE(out.race.countdown_remaining.has_value());
    REQUIRE(*out.race.countdown_remaining == Approx(2.718));

    SECTION("sub-precision jitter produces no delta") {
        RoomState jittered = s;
        jittered.cars[0].x += 1e-6;
        auto delta = compute_state_delta(serialize_room_state(s, 3), serialize_room_state(jittered, 3));
        REQUIRE_FALSE(delta.has_value());
    }
}
