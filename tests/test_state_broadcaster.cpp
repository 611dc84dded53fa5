#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "client/state_rebuilder.hpp"
#include "server/state_broadcaster.hpp"

using Catch::Approx;
using namespace racesync::protocol;
using namespace racesync::server;

namespace {

RoomState make_state() {
    RoomState s;
    s.room_id = "room-1";
    s.track_id = "oval";
    for (int i = 0; i < 4; ++i) {
        CarState car;
        car.player_id = "p" + std::to_string(i);
        car.x = i * 10.0;
        s.cars.push_back(car);
    }
    return s;
}

} // namespace

TEST_CASE("StateBroadcaster first send is a full snapshot") {
    StateBroadcaster broadcaster(BroadcastConfig{});
    auto update = broadcaster.next(make_state());
    REQUIRE(update.has_value());
    REQUIRE(update->type == MessageType::StateFull);
    REQUIRE(update->payload["roomId"] == "room-1");
    REQUIRE(broadcaster.full_snapshots_sent() == 1);
    REQUIRE(broadcaster.last_sent() != nullptr);
}

TEST_CASE("StateBroadcaster sends deltas for small changes") {
    StateBroadcaster broadcaster(BroadcastConfig{});
    RoomState state = make_state();
    REQUIRE(broadcaster.next(state).has_value());

    state.cars[1].x = 12.5;
    state.server_time = 0.05;
    auto update = broadcaster.next(state);
    REQUIRE(update.has_value());
    REQUIRE(update->type == MessageType::StateDelta);
    REQUIRE(broadcaster.deltas_sent() == 1);

    auto delta = update->payload.get<RoomStateDelta>();
    REQUIRE(delta.cars.has_value());
    REQUIRE(delta.cars->updated.size() == 1);
    REQUIRE(delta.cars->updated[0].player_id == "p1");
}

TEST_CASE("StateBroadcaster skips unchanged states") {
    StateBroadcaster broadcaster(BroadcastConfig{});
    RoomState state = make_state();
    REQUIRE(broadcaster.next(state).has_value());
    REQUIRE_FALSE(broadcaster.next(state).has_value());

    SECTION("time-only changes wait for the next real change") {
        state.server_time = 1.0;
        REQUIRE_FALSE(broadcaster.next(state).has_value());
        REQUIRE(broadcaster.last_sent()->server_time == Approx(0.0));

        state.cars[0].z = 3.0;
        auto update = broadcaster.next(state);
        REQUIRE(update.has_value());
        auto delta = update->payload.get<RoomStateDelta>();
        REQUIRE(delta.server_time.has_value());
        REQUIRE(*delta.server_time == Approx(1.0));
    }

    SECTION("forced sends are full") {
        auto update = broadcaster.next(state, true);
        REQUIRE(update.has_value());
        REQUIRE(update->type == MessageType::StateFull);
    }
}

TEST_CASE("StateBroadcaster switches to full on large changes") {
    StateBroadcaster broadcaster(BroadcastConfig{});
    RoomState state = make_state();
    REQUIRE(broadcaster.next(state).has_value());

    for (auto& car : state.cars) {
        car.x += 1.0;
    }
    auto update = broadcaster.next(state);
    REQUIRE(update.has_value());
    REQUIRE(update->type == MessageType::StateFull);
}

TEST_CASE("StateBroadcaster keeps late joiners consistent") {
    StateBroadcaster broadcaster(BroadcastConfig{});
    RoomState state = make_state();
    REQUIRE(broadcaster.next(state).has_value());

    // The room moves on between broadcasts
    state.cars[2].x = 21.0;
    RoomState joiner_base = broadcaster.snapshot_for_new_client(state);
    REQUIRE(joiner_base.cars[2].x == Approx(20.0));

    auto update = broadcaster.next(state);
    REQUIRE(update.has_value());
    REQUIRE(update->type == MessageType::StateDelta);
    auto rebuilt = racesync::client::apply_room_state_delta(&joiner_base, update->payload.get<RoomStateDelta>());
    REQUIRE(rebuilt.has_value());
    REQUIRE(rebuilt->cars[2].x == Approx(21.0));
}

TEST_CASE("StateBroadcaster rounds outgoing state") {
    BroadcastConfig config;
    config.number_precision = 2;
    StateBroadcaster broadcaster(config);
    RoomState state = make_state();
    state.cars[0].x = 0.123456;
    auto update = broadcaster.next(state);
    REQUIRE(update.has_value());
    REQUIRE(update->payload["cars"][0]["x"].get<double>() == Approx(0.12));
}
