#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "protocol/protocol.hpp"
#include <cmath>
#include <cstdint>
#include <span>

using Catch::Approx;
using namespace racesync::protocol;

TEST_CASE("Packet framing") {
    json payload = {{"roomId", "room-1"}};
    auto packet = build_packet(MessageType::RequestStateFull, payload);
    REQUIRE(packet.size() == PacketHeader::serialized_size() + payload.dump().size());

    PacketHeader header;
    header.deserialize(std::span<const uint8_t>(packet.data(), PacketHeader::serialized_size()));
    REQUIRE(header.type == MessageType::RequestStateFull);
    REQUIRE(header.payload_size == packet.size() - PacketHeader::serialized_size());

    auto body = std::span<const uint8_t>(packet).subspan(PacketHeader::serialized_size());
    auto decoded = parse_payload(body).get<RequestStateFullMsg>();
    REQUIRE(decoded.room_id == "room-1");

    SECTION("header serializes into a fixed buffer") {
        uint8_t buf[5] = {};
        PacketHeader out{MessageType::StateDelta, 42};
        out.serialize(buf);
        PacketHeader in;
        in.deserialize(buf);
        REQUIRE(in.type == MessageType::StateDelta);
        REQUIRE(in.payload_size == 42);
    }

    SECTION("empty body is an empty object") {
        REQUIRE(parse_payload({}).is_object());
        REQUIRE(parse_payload({}).empty());
    }

    SECTION("malformed body throws") {
        const std::string junk = "{not json";
        std::vector<uint8_t> bytes(junk.begin(), junk.end());
        REQUIRE_THROWS_AS(parse_payload(bytes), json::parse_error);
    }
}

TEST_CASE("Message type names") {
    REQUIRE(to_event_name(MessageType::StateDelta) == "state_delta");
    REQUIRE(message_type_from_event_name("join_room") == MessageType::JoinRoom);
    REQUIRE_FALSE(message_type_from_event_name("teleport").has_value());
    REQUIRE(is_known_message_type(21));
    REQUIRE_FALSE(is_known_message_type(0));
    REQUIRE_FALSE(is_known_message_type(99));
}

TEST_CASE("State decoding tolerates bad fields") {
    json j = {
        {"roomId", 7},
        {"trackId", "oval"},
        {"serverTime", "soon"},
        {"cars", {
            {{"playerId", "p1"}, {"x", "far"}, {"z", 4.5}, {"turboActive", 1}, {"turboCharges", 2}},
            "not a car",
        }},
        {"missiles", "none"},
        {"radio", {{"enabled", true}, {"stationIndex", 2}}},
    };

    auto state = j.get<RoomState>();
    REQUIRE(state.room_id.empty());
    REQUIRE(state.track_id == "oval");
    REQUIRE(state.server_time == 0.0);
    REQUIRE(state.cars.size() == 1);
    REQUIRE(state.cars[0].player_id == "p1");
    REQUIRE(state.cars[0].x == 0.0);
    REQUIRE(state.cars[0].z == Approx(4.5));
    REQUIRE_FALSE(state.cars[0].turbo_active);
    REQUIRE(state.cars[0].turbo_charges == 2);
    REQUIRE(state.missiles.empty());
    REQUIRE(state.radio.enabled);
    REQUIRE(state.radio.station_index == 2);
    REQUIRE(state.race.phase == RacePhase::Lobby);
}

TEST_CASE("Integer fields reject numbers they cannot hold") {
    json j = {
        {"cars", {
            {{"playerId", "p1"}, {"turboCharges", 1e30}, {"missileCharges", -1e30}},
            {{"playerId", "p2"}, {"turboCharges", 3.7}, {"missileCharges", 18446744073709551615ULL}},
            {{"playerId", "p3"}, {"turboCharges", -2}, {"missileCharges", 2147483647}},
        }},
        {"radio", {{"enabled", true}, {"stationIndex", 3000000000LL}}},
    };

    auto state = j.get<RoomState>();
    REQUIRE(state.cars.size() == 3);
    REQUIRE(state.cars[0].turbo_charges == 0);
    REQUIRE(state.cars[0].missile_charges == 0);
    REQUIRE(state.cars[1].turbo_charges == 3);
    REQUIRE(state.cars[1].missile_charges == 0);
    REQUIRE(state.cars[2].turbo_charges == -2);
    REQUIRE(state.cars[2].missile_charges == 2147483647);
    REQUIRE(state.radio.station_index == 0);

    uint32_t seed = 7;
    REQUIRE_FALSE(read_field(json{{"seed", -1}}, "seed", seed));
    REQUIRE_FALSE(read_field(json{{"seed", std::nan("")}}, "seed", seed));
    REQUIRE(seed == 7);
    REQUIRE(read_field(json{{"seed", 4294967295.0}}, "seed", seed));
    REQUIRE(seed == 4294967295u);
}

TEST_CASE("State encoding") {
    RoomState state;
    state.room_id = "room-1";
    CarState car;
    car.player_id = "p1";
    state.cars.push_back(car);
    MissileState missile;
    missile.id = "p1-m0";
    state.missiles.push_back(missile);
    ItemState item;
    item.id = "item-0";
    item.type = ItemType::Shoot;
    state.items.push_back(item);

    json j = state;
    REQUIRE_FALSE(j["cars"][0].contains("username"));
    REQUIRE_FALSE(j["missiles"][0].contains("targetId"));
    REQUIRE(j["items"][0]["type"] == "shoot");
    REQUIRE(j["race"]["phase"] == "lobby");
    REQUIRE(j["race"]["countdownRemaining"].is_null());

    REQUIRE(j.get<RoomState>() == state);
}

TEST_CASE("Delta encoding") {
    RoomStateDelta delta;
    delta.server_time = 2.0;
    CarDelta cars;
    CarPatch patch;
    patch.player_id = "p1";
    patch.x = 3.0;
    cars.updated.push_back(patch);
    cars.removed.push_back("p2");
    delta.cars = cars;

    json j = delta;
    REQUIRE_FALSE(j.contains("missiles"));
    REQUIRE_FALSE(j.contains("roomId"));
    REQUIRE(j["cars"]["updated"][0]["playerId"] == "p1");
    REQUIRE_FALSE(j["cars"]["updated"][0].contains("z"));

    auto decoded = j.get<RoomStateDelta>();
    REQUIRE(decoded.server_time.has_value());
    REQUIRE(decoded.cars.has_value());
    REQUIRE(decoded.cars->updated.size() == 1);
    REQUIRE(decoded.cars->updated[0].x.has_value());
    REQUIRE_FALSE(decoded.cars->updated[0].z.has_value());
    REQUIRE(decoded.cars->removed == std::vector<std::string>{"p2"});
    REQUIRE_FALSE(decoded.missiles.has_value());
}

TEST_CASE("Join message") {
    SECTION("empty ids are omitted") {
        JoinRoomMsg msg;
        msg.protocol_version = PROTOCOL_VERSION;
        json j = msg;
        REQUIRE(j["role"] == "viewer");
        REQUIRE(j["protocolVersion"] == PROTOCOL_VERSION);
        REQUIRE_FALSE(j.contains("roomId"));
        REQUIRE_FALSE(j.contains("playerId"));
        REQUIRE_FALSE(j.contains("sessionToken"));
    }

    SECTION("protocol version accepts any number") {
        json j = {{"role", "controller"}, {"protocolVersion", 1.0}, {"sessionToken", "abc"}};
        auto msg = j.get<JoinRoomMsg>();
        REQUIRE(msg.role == PlayerRole::Controller);
        REQUIRE(msg.protocol_version == 1);
        REQUIRE(msg.session_token == "abc");
    }

    SECTION("missing or mistyped version stays unset") {
        REQUIRE_FALSE(json({{"role", "viewer"}}).get<JoinRoomMsg>().protocol_version.has_value());
        REQUIRE_FALSE(json({{"protocolVersion", "1"}}).get<JoinRoomMsg>().protocol_version.has_value());
    }

    SECTION("out of range version stays unset") {
        REQUIRE_FALSE(json({{"protocolVersion", 1e30}}).get<JoinRoomMsg>().protocol_version.has_value());
        REQUIRE_FALSE(json({{"protocolVersion", 5000000000LL}}).get<JoinRoomMsg>().protocol_version.has_value());
    }

    SECTION("unknown role falls back to viewer") {
        auto msg = json({{"role", "admin"}}).get<JoinRoomMsg>();
        REQUIRE(msg.role == PlayerRole::Viewer);
    }
}

TEST_CASE("Input message") {
    json j = {{"roomId", "r"}, {"playerId", "p"}, {"steer", -0.5}, {"throttle", 1},
              {"actions", {{"shoot", true}, {"turbo", "yes"}}}};
    auto msg = j.get<InputMsg>();
    REQUIRE(msg.steer == Approx(-0.5));
    REQUIRE(msg.throttle == Approx(1.0));
    REQUIRE(msg.brake == 0.0);
    REQUIRE(msg.actions.has_value());
    REQUIRE(msg.actions->shoot);
    REQUIRE_FALSE(msg.actions->turbo);

    json out = msg;
    REQUIRE(out["actions"] == json({{"shoot", true}}));
}

TEST_CASE("Error message default text") {
    REQUIRE(json::object().get<ErrorMsg>().message == "Unknown error from server");
    REQUIRE(json({{"message", "Room is full"}}).get<ErrorMsg>().message == "Room is full");
}
