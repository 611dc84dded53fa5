#pragma once

#include "protocol/json_fields.hpp"
#include <optional>
#include <string>
#include <vector>

namespace racesync::protocol {

enum class PlayerRole : uint8_t {
    Viewer = 0,
    Controller = 1,
};

inline const char* to_string(PlayerRole role) {
    return role == PlayerRole::Controller ? "controller" : "viewer";
}

inline std::optional<PlayerRole> player_role_from_string(const std::string& s) {
    if (s == "viewer") return PlayerRole::Viewer;
    if (s == "controller") return PlayerRole::Controller;
    return std::nullopt;
}

struct Vec2 {
    double x = 0.0;
    double z = 0.0;

    bool operator==(const Vec2&) const = default;
};

// Track geometry is generated and rendered elsewhere; the core only needs the
// identity, seed and centreline for start-grid placement.
struct TrackData {
    std::string id;
    uint32_t seed = 0;
    double width = 0.0;
    std::vector<Vec2> centerline;

    bool operator==(const TrackData&) const = default;
};

struct PlayerSummary {
    std::string player_id;
    std::string username;
    bool is_npc = false;

    bool operator==(const PlayerSummary&) const = default;
};

// Client -> Server: first message on every (re)connection
struct JoinRoomMsg {
    PlayerRole role = PlayerRole::Viewer;
    std::optional<int> protocol_version;
    std::string room_id;       // Empty = let the server pick/create
    std::string player_id;     // Empty = let the server assign
    std::string session_token; // Required for controllers
};

// Server -> Client: room identity, roster and track
struct RoomInfoMsg {
    std::string room_id;
    std::string player_id;
    PlayerRole role = PlayerRole::Viewer;
    TrackData track;
    std::vector<PlayerSummary> players;
    std::string session_token;
    std::optional<int> protocol_version;
    std::string server_version;
};

struct RequestStateFullMsg {
    std::string room_id;
};

// player_joined / player_updated / player_left
struct PlayerEventMsg {
    std::string room_id;
    std::string player_id;
    std::string username;
};

struct ErrorMsg {
    std::string message;
};

struct InputActions {
    bool turbo = false;
    bool reset = false;
    bool shoot = false;

    bool any() const { return turbo || reset || shoot; }
};

struct InputMsg {
    std::string room_id;
    std::string player_id;
    double steer = 0.0;     // [-1, 1]
    double throttle = 0.0;  // [0, 1]
    double brake = 0.0;     // [0, 1]
    std::optional<InputActions> actions;
    std::string session_token;
};

struct UsernameUpdateMsg {
    std::string room_id;
    std::string player_id;
    std::string username;
};

struct RadioCycleMsg {
    std::string room_id;
};

// ============================================================================
// JSON codecs
// ============================================================================

inline void to_json(json& j, const Vec2& v) {
    j = json{{"x", v.x}, {"z", v.z}};
}

inline void from_json(const json& j, Vec2& v) {
    v = Vec2{};
    read_field(j, "x", v.x);
    read_field(j, "z", v.z);
}

inline void to_json(json& j, const TrackData& track) {
    j = json{
        {"id", track.id},
        {"seed", track.seed},
        {"width", track.width},
        {"centerline", track.centerline},
    };
}

inline void from_json(const json& j, TrackData& track) {
    track = TrackData{};
    read_field(j, "id", track.id);
    read_field(j, "seed", track.seed);
    read_field(j, "width", track.width);
    if (j.is_object()) {
        auto it = j.find("centerline");
        if (it != j.end() && it->is_array()) {
            for (const auto& point : *it) {
                track.centerline.push_back(point.get<Vec2>());
            }
        }
    }
}

inline void to_json(json& j, const PlayerSummary& player) {
    j = json{{"playerId", player.player_id}, {"username", player.username}, {"isNpc", player.is_npc}};
}

inline void from_json(const json& j, PlayerSummary& player) {
    player = PlayerSummary{};
    read_field(j, "playerId", player.player_id);
    read_field(j, "username", player.username);
    read_field(j, "isNpc", player.is_npc);
}

inline void to_json(json& j, const JoinRoomMsg& msg) {
    j = json{{"role", to_string(msg.role)}};
    write_optional(j, "protocolVersion", msg.protocol_version);
    write_if_not_empty(j, "roomId", msg.room_id);
    write_if_not_empty(j, "playerId", msg.player_id);
    write_if_not_empty(j, "sessionToken", msg.session_token);
}

inline void from_json(const json& j, JoinRoomMsg& msg) {
    msg = JoinRoomMsg{};
    std::string role;
    if (read_field(j, "role", role)) {
        if (auto parsed = player_role_from_string(role)) {
            msg.role = *parsed;
        }
    }
    int version = 0;
    if (read_field(j, "protocolVersion", version)) {
        msg.protocol_version = version;
    }
    read_field(j, "roomId", msg.room_id);
    read_field(j, "playerId", msg.player_id);
    read_field(j, "sessionToken", msg.session_token);
}

inline void to_json(json& j, const RoomInfoMsg& msg) {
    j = json{
        {"roomId", msg.room_id},
        {"playerId", msg.player_id},
        {"role", to_string(msg.role)},
        {"track", msg.track},
        {"players", msg.players},
    };
    write_if_not_empty(j, "sessionToken", msg.session_token);
    write_optional(j, "protocolVersion", msg.protocol_version);
    write_if_not_empty(j, "serverVersion", msg.server_version);
}

inline void from_json(const json& j, RoomInfoMsg& msg) {
    msg = RoomInfoMsg{};
    read_field(j, "roomId", msg.room_id);
    read_field(j, "playerId", msg.player_id);
    std::string role;
    if (read_field(j, "role", role)) {
        msg.role = player_role_from_string(role).value_or(PlayerRole::Viewer);
    }
    if (j.is_object()) {
        if (auto it = j.find("track"); it != j.end() && it->is_object()) {
            msg.track = it->get<TrackData>();
        }
        if (auto it = j.find("players"); it != j.end() && it->is_array()) {
            for (const auto& player : *it) {
                if (player.is_object()) {
                    msg.players.push_back(player.get<PlayerSummary>());
                }
            }
        }
    }
    read_field(j, "sessionToken", msg.session_token);
    read_optional(j, "protocolVersion", msg.protocol_version);
    read_field(j, "serverVersion", msg.server_version);
}

inline void to_json(json& j, const RequestStateFullMsg& msg) {
    j = json{{"roomId", msg.room_id}};
}

inline void from_json(const json& j, RequestStateFullMsg& msg) {
    msg = RequestStateFullMsg{};
    read_field(j, "roomId", msg.room_id);
}

inline void to_json(json& j, const PlayerEventMsg& msg) {
    j = json{{"roomId", msg.room_id}, {"playerId", msg.player_id}, {"username", msg.username}};
}

inline void from_json(const json& j, PlayerEventMsg& msg) {
    msg = PlayerEventMsg{};
    read_field(j, "roomId", msg.room_id);
    read_field(j, "playerId", msg.player_id);
    read_field(j, "username", msg.username);
}

inline void to_json(json& j, const ErrorMsg& msg) {
    j = json{{"message", msg.message}};
}

inline void from_json(const json& j, ErrorMsg& msg) {
    msg.message = "Unknown error from server";
    read_field(j, "message", msg.message);
}

inline void to_json(json& j, const InputActions& actions) {
    j = json::object();
    if (actions.turbo) j["turbo"] = true;
    if (actions.reset) j["reset"] = true;
    if (actions.shoot) j["shoot"] = true;
}

inline void from_json(const json& j, InputActions& actions) {
    actions = InputActions{};
    read_field(j, "turbo", actions.turbo);
    read_field(j, "reset", actions.reset);
    read_field(j, "shoot", actions.shoot);
}

inline void to_json(json& j, const InputMsg& msg) {
    j = json{
        {"roomId", msg.room_id},
        {"playerId", msg.player_id},
        {"steer", msg.steer},
        {"throttle", msg.throttle},
        {"brake", msg.brake},
    };
    if (msg.actions) j["actions"] = *msg.actions;
    write_if_not_empty(j, "sessionToken", msg.session_token);
}

inline void from_json(const json& j, InputMsg& msg) {
    msg = InputMsg{};
    read_field(j, "roomId", msg.room_id);
    read_field(j, "playerId", msg.player_id);
    read_field(j, "steer", msg.steer);
    read_field(j, "throttle", msg.throttle);
    read_field(j, "brake", msg.brake);
    if (j.is_object()) {
        if (auto it = j.find("actions"); it != j.end() && it->is_object()) {
            msg.actions = it->get<InputActions>();
        }
    }
    read_field(j, "sessionToken", msg.session_token);
}

inline void to_json(json& j, const UsernameUpdateMsg& msg) {
    j = json{{"roomId", msg.room_id}, {"playerId", msg.player_id}, {"username", msg.username}};
}

inline void from_json(const json& j, UsernameUpdateMsg& msg) {
    msg = UsernameUpdateMsg{};
    read_field(j, "roomId", msg.room_id);
    read_field(j, "playerId", msg.player_id);
    read_field(j, "username", msg.username);
}

inline void to_json(json& j, const RadioCycleMsg& msg) {
    j = json{{"roomId", msg.room_id}};
}

inline void from_json(const json& j, RadioCycleMsg& msg) {
    msg = RadioCycleMsg{};
    read_field(j, "roomId", msg.room_id);
}

} // namespace racesync::protocol
