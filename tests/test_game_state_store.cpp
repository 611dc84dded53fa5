#include <catch2/catch_test_macros.hpp>
#include "client/game_state_store.hpp"
#include <initializer_list>
#include <utility>

using namespace racesync::client;
using namespace racesync::protocol;

namespace {

RoomState state_with_cars(std::initializer_list<std::pair<const char*, const char*>> cars) {
    RoomState state;
    state.room_id = "room-1";
    for (const auto& [id, name] : cars) {
        CarState car;
        car.player_id = id;
        car.username = name;
        state.cars.push_back(car);
    }
    return state;
}

TrackData oval() {
    TrackData track;
    track.id = "oval";
    track.seed = 7;
    track.centerline = {{0.0, 0.0}, {10.0, 0.0}};
    return track;
}

} // namespace

TEST_CASE("GameStateStore starts empty") {
    GameStateStore store;
    REQUIRE(store.state() == nullptr);
    REQUIRE(store.track() == nullptr);
    REQUIRE(store.race() == nullptr);
    REQUIRE(store.cars().empty());
    REQUIRE(store.items().empty());
    REQUIRE_FALSE(store.last_state_time().has_value());
    REQUIRE(store.username_for("ghost") == "ghost");

    int calls = 0;
    store.on_room_info([&](const RoomInfoSnapshot&) { ++calls; });
    store.on_state([&](const RoomState&) { ++calls; });
    REQUIRE(calls == 0);
}

TEST_CASE("GameStateStore replays the last value to new subscribers") {
    GameStateStore store;
    store.set_room_info("room-1", "p1", oval(), {{"p1", "Ana", false}});
    store.update_state(state_with_cars({{"p1", "Ana"}}));

    RoomInfoSnapshot info;
    int info_calls = 0;
    auto unsubscribe_info = store.on_room_info([&](const RoomInfoSnapshot& s) {
        info = s;
        ++info_calls;
    });
    REQUIRE(info_calls == 1);
    REQUIRE(info.room_id == "room-1");
    REQUIRE(info.player_id == "p1");
    REQUIRE(info.track.has_value());
    REQUIRE(info.track->id == "oval");

    int state_calls = 0;
    auto unsubscribe_state = store.on_state([&](const RoomState& s) {
        REQUIRE(s.room_id == "room-1");
        ++state_calls;
    });
    REQUIRE(state_calls == 1);

    store.update_state(state_with_cars({{"p1", "Ana"}}));
    REQUIRE(state_calls == 2);
    // Roster unchanged, so no room info notification
    REQUIRE(info_calls == 1);

    unsubscribe_state();
    store.update_state(state_with_cars({{"p1", "Ana"}}));
    REQUIRE(state_calls == 2);
    unsubscribe_info();
}

TEST_CASE("GameStateStore roster") {
    GameStateStore store;
    store.set_room_info("room-1", "p1", oval(), {{"p1", "", false}, {"p2", "Bo", false}});

    SECTION("blank usernames fall back to the id") {
        REQUIRE(store.username_for("p1") == "p1");
        REQUIRE(store.username_for("p2") == "Bo");
    }

    SECTION("snapshots add and drop players") {
        int info_calls = 0;
        store.on_room_info([&](const RoomInfoSnapshot&) { ++info_calls; });
        REQUIRE(info_calls == 1);

        store.update_state(state_with_cars({{"p1", "Ana"}, {"p3", "Cy"}}));
        REQUIRE(info_calls == 2);
        REQUIRE(store.players().size() == 2);
        REQUIRE(store.username_for("p1") == "Ana");
        REQUIRE(store.username_for("p3") == "Cy");
        REQUIRE(store.username_for("p2") == "p2");
    }

    SECTION("snapshots without a username keep the known name") {
        store.update_state(state_with_cars({{"p1", ""}, {"p2", ""}}));
        REQUIRE(store.username_for("p2") == "Bo");
        REQUIRE(store.username_for("p1") == "p1");
    }

    SECTION("race players count as present") {
        RoomState state = state_with_cars({{"p1", "Ana"}});
        RacePlayer bot;
        bot.player_id = "npc-1";
        bot.username = "Bot";
        bot.is_npc = true;
        state.race.players.push_back(bot);
        store.update_state(state);

        REQUIRE(store.players().size() == 2);
        REQUIRE(store.username_for("npc-1") == "Bot");
        REQUIRE(store.players()[1].is_npc);
    }

    SECTION("player events") {
        int info_calls = 0;
        store.on_room_info([&](const RoomInfoSnapshot&) { ++info_calls; });

        store.update_player({"p2", "Bobby", false});
        REQUIRE(store.username_for("p2") == "Bobby");
        REQUIRE(info_calls == 2);

        store.update_player({"p2", "Bobby", false});
        REQUIRE(info_calls == 2);

        store.update_player({"", "Nobody", false});
        REQUIRE(store.players().size() == 2);

        store.remove_player("p2");
        REQUIRE(store.players().size() == 1);
        REQUIRE(info_calls == 3);

        store.remove_player("missing");
        REQUIRE(info_calls == 3);
    }

    SECTION("renames keep the npc flag") {
        store.update_player({"npc-1", "Bot", true});
        store.update_player_username("npc-1", "Bot2");
        REQUIRE(store.username_for("npc-1") == "Bot2");
        REQUIRE(store.players().back().is_npc);

        store.update_player_username("p4", "Dee");
        REQUIRE(store.username_for("p4") == "Dee");
        REQUIRE_FALSE(store.players().back().is_npc);
    }
}

TEST_CASE("GameStateStore exposes the current snapshot") {
    GameStateStore store;
    RoomState state = state_with_cars({{"p1", "Ana"}});
    ItemState item;
    item.id = "item-0";
    state.items.push_back(item);
    state.race.phase = RacePhase::Countdown;
    store.update_state(state);

    REQUIRE(store.state() != nullptr);
    REQUIRE(store.cars().size() == 1);
    REQUIRE(store.items().size() == 1);
    REQUIRE(store.missiles().empty());
    REQUIRE(store.race()->phase == RacePhase::Countdown);
    REQUIRE(store.last_state_time().has_value());
}
