#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "client/state_rebuilder.hpp"
#include <algorithm>

using Catch::Approx;
using namespace racesync::protocol;
using namespace racesync::client;

namespace {

RoomState make_base() {
    RoomState state;
    state.room_id = "room-1";
    state.track_id = "oval";
    state.server_time = 10.0;
    CarState car;
    car.player_id = "a";
    car.speed = 5.0;
    state.cars.push_back(car);
    return state;
}

const CarState* find_car(const RoomState& state, const std::string& id) {
    auto it = std::find_if(state.cars.begin(), state.cars.end(),
                           [&](const CarState& c) { return c.player_id == id; });
    return it == state.cars.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("apply_room_state_delta without a base") {
    RoomStateDelta delta;
    delta.server_time = 1.0;
    REQUIRE_FALSE(apply_room_state_delta(nullptr, delta).has_value());
}

TEST_CASE("apply_room_state_delta partial car update") {
    RoomState base = make_base();

    RoomStateDelta delta;
    CarPatch patch;
    patch.player_id = "a";
    patch.x = 1.0;
    patch.z = 0.0;
    delta.cars = CarDelta{};
    delta.cars->updated.push_back(patch);

    auto result = apply_room_state_delta(&base, delta);
    REQUIRE(result.has_value());
    REQUIRE(result->cars.size() == 1);
    const CarState& car = result->cars[0];
    REQUIRE(car.player_id == "a");
    REQUIRE(car.x == Approx(1.0));
    REQUIRE(car.z == Approx(0.0));
    REQUIRE(car.angle == Approx(0.0));
    REQUIRE(car.speed == Approx(5.0));

    SECTION("base is untouched") {
        REQUIRE(base.cars[0].x == 0.0);
    }

    SECTION("scalars not supplied are kept") {
        REQUIRE(result->room_id == "room-1");
        REQUIRE(result->track_id == "oval");
        REQUIRE(result->server_time == Approx(10.0));
    }
}

TEST_CASE("apply_room_state_delta removal happens before add") {
    RoomState base = make_base();

    SECTION("removed id with a different added entry") {
        RoomStateDelta delta;
        delta.cars = CarDelta{};
        delta.cars->removed.push_back("a");
        CarState b;
        b.player_id = "b";
        delta.cars->added.push_back(b);

        auto result = apply_room_state_delta(&base, delta);
        REQUIRE(result.has_value());
        REQUIRE(result->cars.size() == 1);
        REQUIRE(result->cars[0].player_id == "b");
        REQUIRE(find_car(*result, "a") == nullptr);
    }

    SECTION("same id removed and re-added ends up present") {
        RoomStateDelta delta;
        delta.cars = CarDelta{};
        delta.cars->removed.push_back("a");
        CarState again;
        again.player_id = "a";
        again.x = 9.0;
        delta.cars->added.push_back(again);

        auto result = apply_room_state_delta(&base, delta);
        REQUIRE(result.has_value());
        REQUIRE(result->cars.size() == 1);
        REQUIRE(result->cars[0].x == Approx(9.0));
        REQUIRE(result->cars[0].speed == Approx(0.0));
    }
}

TEST_CASE("apply_room_state_delta materializes unknown patches") {
    RoomState base = make_base();
    RoomStateDelta delta;
    delta.missiles = MissileDelta{};
    MissilePatch patch;
    patch.id = "m1";
    patch.x = 3.0;
    delta.missiles->updated.push_back(patch);

    auto result = apply_room_state_delta(&base, delta);
    REQUIRE(result.has_value());
    REQUIRE(result->missiles.size() == 1);
    REQUIRE(result->missiles[0].id == "m1");
    REQUIRE(result->missiles[0].x == Approx(3.0));
    REQUIRE(result->missiles[0].owner_id.empty());
}

TEST_CASE("apply_room_state_delta items and scalars") {
    RoomState base = make_base();
    ItemState item;
    item.id = "item-0";
    base.items.push_back(item);

    RoomStateDelta delta;
    delta.items = ItemDelta{};
    delta.items->removed.push_back("item-0");
    ItemState fresh;
    fresh.id = "item-1";
    fresh.type = ItemType::Shoot;
    delta.items->added.push_back(fresh);
    delta.radio = RadioState{true, 2};
    delta.server_time = 11.5;

    auto result = apply_room_state_delta(&base, delta);
    REQUIRE(result.has_value());
    REQUIRE(result->items.size() == 1);
    REQUIRE(result->items[0].id == "item-1");
    REQUIRE(result->items[0].type == ItemType::Shoot);
    REQUIRE(result->radio.enabled);
    REQUIRE(result->radio.station_index == 2);
    REQUIRE(result->server_time == Approx(11.5));
}

TEST_CASE("apply_room_state_delta is idempotent") {
    RoomState base = make_base();
    RoomStateDelta delta;
    delta.cars = CarDelta{};
    CarPatch patch;
    patch.player_id = "a";
    patch.x = 4.0;
    patch.turbo_active = true;
    delta.cars->updated.push_back(patch);
    CarState b;
    b.player_id = "b";
    delta.cars->added.push_back(b);
    delta.server_time = 12.0;

    auto once = apply_room_state_delta(&base, delta);
    REQUIRE(once.has_value());
    auto twice = apply_room_state_delta(&*once, delta);
    REQUIRE(twice.has_value());
    REQUIRE(*once == *twice);
}

TEST_CASE("apply_room_state_delta with an empty delta") {
    RoomState base = make_base();
    auto result = apply_room_state_delta(&base, RoomStateDelta{});
    REQUIRE(result.has_value());
    REQUIRE(*result == base);
}
