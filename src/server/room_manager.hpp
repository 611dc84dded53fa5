#pragma once

#include "protocol/messages.hpp"
#include "server/game_config.hpp"
#include "server/room.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace racesync::server {

struct JoinResult {
    Room* room = nullptr;
    std::string player_id;
    protocol::PlayerRole role = protocol::PlayerRole::Viewer;
    std::string session_token;
    bool room_created = false;
    bool player_created = false;
};

struct RemovedPlayer {
    std::string room_id;
    std::string player_id;
    std::string username;
};

struct DisconnectResult {
    std::vector<RemovedPlayer> removed_players;
    std::vector<std::string> deleted_rooms;
    // Controller connections orphaned because their player left
    std::vector<ConnectionId> orphaned_controllers;
};

struct UsernameResult {
    Room* room = nullptr;
    std::string player_id;
    std::string username;
};

// Owns every room and the connection -> room/role/player bindings.
// Every handle_* that rejects a request throws std::runtime_error with a
// message meant for the client.
class RoomManager {
public:
    explicit RoomManager(const GameConfig& config);

    JoinResult handle_join(ConnectionId connection, const protocol::JoinRoomMsg& msg);
    void handle_input(ConnectionId connection, const protocol::InputMsg& msg);
    Room& handle_radio_cycle(ConnectionId connection);
    UsernameResult handle_username_update(ConnectionId connection, const protocol::UsernameUpdateMsg& msg);
    DisconnectResult handle_disconnect(ConnectionId connection);

    // Validates the client's protocol version against the configured one
    void check_protocol_version(const std::optional<int>& version) const;

    Room* find_room(const std::string& room_id);
    Room* room_for_connection(ConnectionId connection);
    std::optional<protocol::PlayerRole> role_for_connection(ConnectionId connection) const;

    void update(double dt);

    size_t room_count() const { return rooms_.size(); }
    std::vector<Room*> rooms();

private:
    struct Binding {
        std::string room_id;
        protocol::PlayerRole role = protocol::PlayerRole::Viewer;
        std::string player_id;
    };

    JoinResult join_viewer(ConnectionId connection, const protocol::JoinRoomMsg& msg);
    JoinResult join_controller(ConnectionId connection, const protocol::JoinRoomMsg& msg);

    Room& resolve_room(const std::string& room_id, bool& created);
    std::string generate_room_id();
    std::string generate_player_id(const Room& room);
    std::string generate_token();

    const std::string* session_token(const std::string& room_id, const std::string& player_id) const;
    const std::string& get_or_create_session_token(const std::string& room_id, const std::string& player_id);
    void delete_session_token(const std::string& room_id, const std::string& player_id);

    const GameConfig& config_;

    // Ordered so room reuse picks the oldest room first
    std::map<std::string, std::unique_ptr<Room>> rooms_;
    std::vector<std::string> room_order_;
    std::unordered_map<ConnectionId, Binding> bindings_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> session_tokens_;

    uint32_t next_room_number_ = 1;
    uint32_t next_player_number_ = 1;
    std::mt19937_64 rng_;
};

} // namespace racesync::server
