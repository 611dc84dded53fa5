#include "room_manager.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace racesync::server {

using namespace racesync::protocol;

RoomManager::RoomManager(const GameConfig& config)
    : config_(config)
    , rng_(std::random_device{}()) {
}

void RoomManager::check_protocol_version(const std::optional<int>& version) const {
    if (!version) {
        throw std::runtime_error("Protocol version required");
    }
    int normalized = std::max(1, *version);
    if (normalized != config_.server().protocol_version) {
        throw std::runtime_error("Unsupported protocol version " + std::to_string(*version));
    }
}

JoinResult RoomManager::handle_join(ConnectionId connection, const JoinRoomMsg& msg) {
    if (bindings_.count(connection)) {
        throw std::runtime_error("Connection already joined a room");
    }
    if (msg.role == PlayerRole::Controller) {
        return join_controller(connection, msg);
    }
    return join_viewer(connection, msg);
}

JoinResult RoomManager::join_viewer(ConnectionId connection, const JoinRoomMsg& msg) {
    check_protocol_version(msg.protocol_version);

    JoinResult result;
    result.role = PlayerRole::Viewer;
    Room& room = resolve_room(msg.room_id, result.room_created);

    std::string player_id = msg.player_id;
    if (player_id.empty()) {
        player_id = generate_player_id(room);
    } else if (room.is_player_id_taken(player_id)) {
        throw std::runtime_error("Player already assigned");
    }

    room.add_viewer(connection, player_id);
    bindings_[connection] = Binding{room.room_id(), PlayerRole::Viewer, player_id};

    result.room = &room;
    result.player_id = player_id;
    result.session_token = get_or_create_session_token(room.room_id(), player_id);

    std::cout << "[RoomManager] Viewer " << connection << " joined " << room.room_id()
              << " as " << player_id << std::endl;
    return result;
}

JoinResult RoomManager::join_controller(ConnectionId connection, const JoinRoomMsg& msg) {
    if (msg.room_id.empty()) {
        throw std::runtime_error("roomId is required for controllers");
    }
    if (msg.player_id.empty()) {
        throw std::runtime_error("playerId is required for controllers");
    }

    Room* room = find_room(msg.room_id);
    if (!room) {
        throw std::runtime_error("Room not found");
    }
    if (!room->has_viewer_for_player(msg.player_id)) {
        throw std::runtime_error("Viewer session not found for player");
    }

    check_protocol_version(msg.protocol_version);
    const std::string* expected = session_token(room->room_id(), msg.player_id);
    if (!expected || msg.session_token.empty() || msg.session_token != *expected) {
        throw std::runtime_error("Invalid session token");
    }

    JoinResult result;
    result.role = PlayerRole::Controller;
    if (!room->has_car(msg.player_id)) {
        if (room->human_player_count() >= config_.server().max_players_per_room) {
            throw std::runtime_error("Room is full");
        }
        room->add_player(msg.player_id);
        result.player_created = true;
    }

    // A second controller for the same player replaces the first
    if (auto previous = room->controller_for(msg.player_id)) {
        room->detach_controller(*previous);
        bindings_.erase(*previous);
    }

    room->attach_controller(connection, msg.player_id);
    bindings_[connection] = Binding{room->room_id(), PlayerRole::Controller, msg.player_id};

    result.room = room;
    result.player_id = msg.player_id;
    result.session_token = *expected;

    std::cout << "[RoomManager] Controller " << connection << " bound to " << msg.player_id
              << " in " << room->room_id() << std::endl;
    return result;
}

void RoomManager::handle_input(ConnectionId connection, const InputMsg& msg) {
    auto it = bindings_.find(connection);
    if (it == bindings_.end() || it->second.role != PlayerRole::Controller) {
        throw std::runtime_error("Connection not allowed to send inputs");
    }
    const Binding& binding = it->second;

    Room* room = find_room(binding.room_id);
    if (!room) {
        throw std::runtime_error("Room not found");
    }
    if (!room->has_car(binding.player_id)) {
        throw std::runtime_error("Player not found in room");
    }

    const std::string* expected = session_token(binding.room_id, binding.player_id);
    if (!expected || msg.session_token.empty() || msg.session_token != *expected) {
        throw std::runtime_error("Invalid session token");
    }

    room->apply_input(binding.player_id, msg);
}

Room& RoomManager::handle_radio_cycle(ConnectionId connection) {
    Room* room = room_for_connection(connection);
    if (!room) {
        throw std::runtime_error("Room not found");
    }
    room->cycle_radio();
    return *room;
}

UsernameResult RoomManager::handle_username_update(ConnectionId connection, const UsernameUpdateMsg& msg) {
    auto it = bindings_.find(connection);
    if (it == bindings_.end() || it->second.role != PlayerRole::Controller) {
        throw std::runtime_error("Only the controller can update the username");
    }
    const Binding& binding = it->second;
    if (msg.room_id != binding.room_id || msg.player_id != binding.player_id) {
        throw std::runtime_error("Controller session not bound to this player");
    }

    Room* room = find_room(binding.room_id);
    if (!room) {
        throw std::runtime_error("Room not found");
    }

    UsernameResult result;
    result.room = room;
    result.player_id = binding.player_id;
    result.username = room->update_username(binding.player_id, msg.username);
    return result;
}

DisconnectResult RoomManager::handle_disconnect(ConnectionId connection) {
    DisconnectResult result;
    auto it = bindings_.find(connection);
    if (it == bindings_.end()) {
        return result;
    }
    Binding binding = it->second;
    bindings_.erase(it);

    Room* room = find_room(binding.room_id);
    if (!room) {
        return result;
    }

    if (binding.role == PlayerRole::Viewer) {
        std::string username = room->username_for(binding.player_id);
        auto removed_id = room->remove_viewer(connection);
        if (removed_id && *removed_id == binding.player_id) {
            delete_session_token(room->room_id(), binding.player_id);
            bool had_car = room->has_car(binding.player_id);
            if (auto controller = room->remove_player(binding.player_id)) {
                bindings_.erase(*controller);
                result.orphaned_controllers.push_back(*controller);
            }
            if (had_car) {
                result.removed_players.push_back(RemovedPlayer{room->room_id(), binding.player_id, username});
            }
        }
    } else {
        room->detach_controller(connection);
    }

    if (room->is_empty()) {
        std::string room_id = room->room_id();
        session_tokens_.erase(room_id);
        rooms_.erase(room_id);
        room_order_.erase(std::remove(room_order_.begin(), room_order_.end(), room_id), room_order_.end());
        result.deleted_rooms.push_back(room_id);
        std::cout << "[RoomManager] Room " << room_id << " closed" << std::endl;
    }
    return result;
}

Room* RoomManager::find_room(const std::string& room_id) {
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? nullptr : it->second.get();
}

Room* RoomManager::room_for_connection(ConnectionId connection) {
    auto it = bindings_.find(connection);
    if (it == bindings_.end()) return nullptr;
    return find_room(it->second.room_id);
}

std::optional<PlayerRole> RoomManager::role_for_connection(ConnectionId connection) const {
    auto it = bindings_.find(connection);
    if (it == bindings_.end()) return std::nullopt;
    return it->second.role;
}

void RoomManager::update(double dt) {
    for (const auto& room_id : room_order_) {
        rooms_.at(room_id)->update(dt);
    }
}

std::vector<Room*> RoomManager::rooms() {
    std::vector<Room*> out;
    out.reserve(room_order_.size());
    for (const auto& room_id : room_order_) {
        out.push_back(rooms_.at(room_id).get());
    }
    return out;
}

Room& RoomManager::resolve_room(const std::string& room_id, bool& created) {
    created = false;
    if (!room_id.empty()) {
        Room* existing = find_room(room_id);
        if (!existing) {
            throw std::runtime_error("Room not found");
        }
        return *existing;
    }

    for (const auto& id : room_order_) {
        Room& candidate = *rooms_.at(id);
        if (candidate.human_player_count() < config_.server().max_players_per_room) {
            return candidate;
        }
    }

    std::string new_id = generate_room_id();
    auto room = std::make_unique<Room>(new_id, config_);
    Room& ref = *room;
    rooms_.emplace(new_id, std::move(room));
    room_order_.push_back(new_id);
    created = true;
    std::cout << "[RoomManager] Created room " << new_id << std::endl;
    return ref;
}

std::string RoomManager::generate_room_id() {
    std::string id;
    do {
        id = "room-" + std::to_string(next_room_number_++);
    } while (rooms_.count(id));
    return id;
}

std::string RoomManager::generate_player_id(const Room& room) {
    std::string id;
    do {
        id = "player-" + std::to_string(next_player_number_++);
    } while (room.is_player_id_taken(id));
    return id;
}

std::string RoomManager::generate_token() {
    char buf[33];
    uint64_t hi = rng_();
    uint64_t lo = rng_();
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(hi), static_cast<unsigned long long>(lo));
    return std::string(buf);
}

const std::string* RoomManager::session_token(const std::string& room_id, const std::string& player_id) const {
    auto room_it = session_tokens_.find(room_id);
    if (room_it == session_tokens_.end()) return nullptr;
    auto it = room_it->second.find(player_id);
    return it == room_it->second.end() ? nullptr : &it->second;
}

const std::string& RoomManager::get_or_create_session_token(const std::string& room_id, const std::string& player_id) {
    auto& tokens = session_tokens_[room_id];
    auto it = tokens.find(player_id);
    if (it != tokens.end()) {
        return it->second;
    }
    return tokens.emplace(player_id, generate_token()).first->second;
}

void RoomManager::delete_session_token(const std::string& room_id, const std::string& player_id) {
    auto room_it = session_tokens_.find(room_id);
    if (room_it == session_tokens_.end()) return;
    room_it->second.erase(player_id);
    if (room_it->second.empty()) {
        session_tokens_.erase(room_it);
    }
}

} // namespace racesync::server
