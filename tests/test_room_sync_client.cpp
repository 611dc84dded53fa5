#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "client/room_sync_client.hpp"
#include <algorithm>
#include <span>
#include <string>
#include <utility>
#include <vector>

using Catch::Approx;
using namespace racesync::client;
using namespace racesync::protocol;

namespace {

struct Outbox {
    std::vector<std::pair<MessageType, nlohmann::json>> sent;

    RoomSyncClient::SendFunction sender() {
        return [this](MessageType type, const nlohmann::json& payload) {
            sent.emplace_back(type, payload);
        };
    }

    size_t count(MessageType type) const {
        size_t n = 0;
        for (const auto& [t, p] : sent) {
            if (t == type) ++n;
        }
        return n;
    }
};

nlohmann::json room_info_payload() {
    RoomInfoMsg info;
    info.room_id = "room-1";
    info.player_id = "p1";
    info.track.id = "oval";
    info.players = {{"p1", "Ana", false}};
    info.session_token = "tok";
    info.protocol_version = PROTOCOL_VERSION;
    info.server_version = "1.0.0";
    return info;
}

nlohmann::json full_state_payload(double x) {
    RoomState state;
    state.room_id = "room-1";
    CarState car;
    car.player_id = "p1";
    car.username = "Ana";
    car.x = x;
    state.cars.push_back(car);
    return state;
}

nlohmann::json car_move_delta(double x) {
    RoomStateDelta delta;
    CarDelta cars;
    CarPatch patch;
    patch.player_id = "p1";
    patch.x = x;
    cars.updated.push_back(patch);
    delta.cars = cars;
    return delta;
}

} // namespace

TEST_CASE("RoomSyncClient connection states") {
    GameStateStore store;
    Outbox outbox;
    RoomSyncClient client(store, RoomSyncConfig{}, outbox.sender());
    REQUIRE(client.state() == ConnectionState::Disconnected);

    client.begin_connect();
    REQUIRE(client.state() == ConnectionState::Connecting);

    client.on_transport_connected();
    REQUIRE(outbox.count(MessageType::JoinRoom) == 1);
    const auto& join = outbox.sent.back().second;
    REQUIRE(join["role"] == "viewer");
    REQUIRE(join["protocolVersion"] == PROTOCOL_VERSION);
    REQUIRE_FALSE(join.contains("roomId"));

    client.handle_message(MessageType::RoomInfo, room_info_payload());
    REQUIRE(client.state() == ConnectionState::Joined);
    REQUIRE(client.room_id() == "room-1");
    REQUIRE(client.player_id() == "p1");
    REQUIRE(client.session_token() == "tok");
    REQUIRE(client.server_version() == "1.0.0");
    REQUIRE(store.room_id() == "room-1");
    REQUIRE(store.track() != nullptr);

    client.handle_message(MessageType::StateFull, full_state_payload(1.0));
    REQUIRE(client.state() == ConnectionState::Synchronized);
    REQUIRE(store.cars().size() == 1);

    SECTION("deltas apply onto the stored snapshot") {
        client.handle_message(MessageType::StateDelta, car_move_delta(4.0));
        REQUIRE(client.state() == ConnectionState::Synchronized);
        REQUIRE(store.cars()[0].x == Approx(4.0));
        REQUIRE(client.resync_requests() == 0);
    }

    SECTION("legacy full state message") {
        client.handle_message(MessageType::State, full_state_payload(9.0));
        REQUIRE(store.cars()[0].x == Approx(9.0));
    }

    SECTION("transport loss") {
        std::string reason;
        client.on_disconnect([&](const std::string& r) { reason = r; });
        client.on_transport_disconnected("eof");
        REQUIRE(client.state() == ConnectionState::Disconnected);
        REQUIRE(reason == "eof");

        SECTION("reconnect rejoins with the assigned ids") {
            client.on_transport_connected();
            const auto& rejoin = outbox.sent.back();
            REQUIRE(rejoin.first == MessageType::JoinRoom);
            REQUIRE(rejoin.second["roomId"] == "room-1");
            REQUIRE(rejoin.second["playerId"] == "p1");
            REQUIRE(rejoin.second["sessionToken"] == "tok");
            REQUIRE(client.state() == ConnectionState::Connecting);
        }
    }

    SECTION("rejoin on a live transport") {
        client.rejoin();
        REQUIRE(client.state() == ConnectionState::Connecting);
        REQUIRE(outbox.count(MessageType::JoinRoom) == 2);
        REQUIRE(outbox.count(MessageType::RequestStateFull) == 1);
        REQUIRE(outbox.sent.back().first == MessageType::RequestStateFull);
        REQUIRE(outbox.sent.back().second["roomId"] == "room-1");
        REQUIRE(client.resync_requests() == 1);

        // A delta before the next snapshot has no base
        client.handle_message(MessageType::StateDelta, car_move_delta(4.0));
        REQUIRE(client.resync_requests() == 2);
        REQUIRE(store.cars()[0].x == Approx(1.0));
    }

    SECTION("stale delta after transport loss") {
        client.on_transport_disconnected("reset");
        const size_t sent_before = outbox.sent.size();
        client.handle_message(MessageType::StateDelta, car_move_delta(4.0));
        REQUIRE(client.state() == ConnectionState::Disconnected);
        REQUIRE(client.resync_requests() == 0);
        REQUIRE(outbox.sent.size() == sent_before);
        REQUIRE(store.cars()[0].x == Approx(1.0));
    }
}

TEST_CASE("RoomSyncClient resyncs when a delta has no base") {
    GameStateStore store;
    Outbox outbox;
    RoomSyncClient client(store, RoomSyncConfig{}, outbox.sender());
    client.on_transport_connected();
    client.handle_message(MessageType::RoomInfo, room_info_payload());

    int state_calls = 0;
    store.on_state([&](const RoomState&) { ++state_calls; });

    client.handle_message(MessageType::StateDelta, car_move_delta(2.0));
    REQUIRE(client.state() == ConnectionState::Joined);
    REQUIRE(client.resync_requests() == 1);
    REQUIRE(outbox.count(MessageType::RequestStateFull) == 1);
    REQUIRE(outbox.sent.back().second["roomId"] == "room-1");
    REQUIRE(state_calls == 0);
    REQUIRE(store.state() == nullptr);

    client.handle_message(MessageType::StateFull, full_state_payload(2.0));
    REQUIRE(client.state() == ConnectionState::Synchronized);
    REQUIRE(state_calls == 1);
}

TEST_CASE("RoomSyncClient roster events") {
    GameStateStore store;
    Outbox outbox;
    RoomSyncClient client(store, RoomSyncConfig{}, outbox.sender());
    client.handle_message(MessageType::RoomInfo, room_info_payload());

    client.handle_message(MessageType::PlayerJoined, {{"roomId", "room-1"}, {"playerId", "p2"}, {"username", "Bo"}});
    REQUIRE(store.username_for("p2") == "Bo");

    client.handle_message(MessageType::PlayerUpdated, {{"roomId", "room-1"}, {"playerId", "p2"}, {"username", "Bobby"}});
    REQUIRE(store.username_for("p2") == "Bobby");

    client.handle_message(MessageType::PlayerLeft, {{"roomId", "room-1"}, {"playerId", "p2"}});
    REQUIRE(store.players().size() == 1);
}

TEST_CASE("RoomSyncClient rename keeps the npc flag") {
    GameStateStore store;
    Outbox outbox;
    RoomSyncClient client(store, RoomSyncConfig{}, outbox.sender());
    auto info = room_info_payload();
    info["players"].push_back({{"playerId", "npc1"}, {"username", "Bot"}, {"isNpc", true}});
    client.handle_message(MessageType::RoomInfo, info);

    client.handle_message(MessageType::PlayerUpdated, {{"roomId", "room-1"}, {"playerId", "npc1"}, {"username", "Bot2"}});
    REQUIRE(store.username_for("npc1") == "Bot2");
    const auto& players = store.players();
    auto it = std::find_if(players.begin(), players.end(),
                           [](const PlayerSummary& p) { return p.player_id == "npc1"; });
    REQUIRE(it != players.end());
    REQUIRE(it->is_npc);
}

TEST_CASE("RoomSyncClient errors and malformed frames") {
    GameStateStore store;
    Outbox outbox;
    RoomSyncClient client(store, RoomSyncConfig{}, outbox.sender());

    std::vector<std::string> errors;
    client.on_error([&](const std::string& e) { errors.push_back(e); });

    client.handle_message(MessageType::ErrorMessage, {{"message", "Room not found"}});
    REQUIRE(errors == std::vector<std::string>{"Room not found"});

    const std::string junk = "{{{";
    std::vector<uint8_t> bytes(junk.begin(), junk.end());
    client.handle_frame(MessageType::StateFull, bytes);
    REQUIRE(store.state() == nullptr);
    REQUIRE(client.state() == ConnectionState::Disconnected);

    auto packet = build_packet(MessageType::ErrorMessage, nlohmann::json::object());
    client.handle_frame(MessageType::ErrorMessage,
                        std::span<const uint8_t>(packet).subspan(PacketHeader::serialized_size()));
    REQUIRE(errors.back() == "Unknown error from server");
}

TEST_CASE("RoomSyncClient outbound messages") {
    GameStateStore store;
    Outbox outbox;
    RoomSyncConfig config;
    config.role = PlayerRole::Controller;
    config.room_id = "room-1";
    config.player_id = "p1";
    config.session_token = "tok";
    RoomSyncClient client(store, config, outbox.sender());

    client.send_input(0.5, 1.0, 0.0, InputActions{true, false, false});
    REQUIRE(outbox.sent.back().first == MessageType::Input);
    auto input = outbox.sent.back().second.get<InputMsg>();
    REQUIRE(input.steer == Approx(0.5));
    REQUIRE(input.throttle == Approx(1.0));
    REQUIRE(input.session_token == "tok");
    REQUIRE(input.actions.has_value());
    REQUIRE(input.actions->turbo);

    client.update_username("Ana");
    REQUIRE(outbox.sent.back().first == MessageType::UpdateUsername);
    REQUIRE(outbox.sent.back().second["username"] == "Ana");

    client.cycle_radio();
    REQUIRE(outbox.sent.back().first == MessageType::RadioCycle);
    REQUIRE(outbox.sent.back().second["roomId"] == "room-1");

    SECTION("inputs need an assigned player") {
        GameStateStore other_store;
        Outbox other;
        RoomSyncClient unassigned(other_store, RoomSyncConfig{}, other.sender());
        unassigned.send_input(1.0, 1.0, 0.0);
        unassigned.update_username("x");
        unassigned.cycle_radio();
        REQUIRE(other.sent.empty());
    }
}
