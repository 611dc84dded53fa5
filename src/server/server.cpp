#include "server.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace racesync::server {

using namespace racesync::protocol;

Server::Server(asio::io_context& io_context, uint16_t port, const GameConfig& config)
    : io_context_(io_context)
    , acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , config_(config)
    , rooms_(config)
    , tick_timer_(io_context)
    , last_tick_(std::chrono::steady_clock::now()) {
}

Server::~Server() {
    stop();
}

uint16_t Server::port() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void Server::start() {
    running_ = true;
    last_tick_ = std::chrono::steady_clock::now();
    accept();
    game_loop();
    std::cout << "[Server] Started on port " << port() << std::endl;
}

void Server::stop() {
    if (!running_ && !acceptor_.is_open()) return;
    running_ = false;
    tick_timer_.cancel();

    asio::error_code ec;
    acceptor_.close(ec);

    // Closing triggers on_disconnect from the sessions' pending reads
    auto sessions = sessions_;
    for (auto& [id, session] : sessions) {
        session->close();
    }
}

void Server::accept() {
    acceptor_.async_accept(
        [this](asio::error_code ec, tcp::socket socket) {
            if (!ec) {
                asio::error_code endpoint_ec;
                auto remote = socket.remote_endpoint(endpoint_ec);
                ConnectionId id = next_connection_id_++;
                std::cout << "[Server] Connection " << id << " from "
                          << (endpoint_ec ? std::string("unknown") : remote.address().to_string())
                          << std::endl;
                auto session = std::make_shared<Session>(std::move(socket), *this, id);
                sessions_[id] = session;
                session->start();
            }

            if (running_) {
                accept();
            }
        });
}

void Server::on_join_room(std::shared_ptr<Session> session, const JoinRoomMsg& msg) {
    JoinResult result;
    try {
        result = rooms_.handle_join(session->id(), msg);
    } catch (const std::runtime_error& e) {
        send_error(*session, e.what());
        return;
    }

    Room& room = *result.room;

    RoomInfoMsg info;
    info.room_id = room.room_id();
    info.player_id = result.player_id;
    info.role = result.role;
    info.track = room.track();
    info.players = room.players();
    info.session_token = result.session_token;
    info.protocol_version = config_.server().protocol_version;
    info.server_version = config_.server().server_version;
    session->send(build_packet(MessageType::RoomInfo, info));

    // Initial base for the client's delta stream
    StateBroadcaster& broadcaster = broadcaster_for(room.room_id());
    session->send(build_packet(MessageType::StateFull, broadcaster.snapshot_for_new_client(room.state())));

    if (result.player_created) {
        PlayerEventMsg joined{room.room_id(), result.player_id, room.username_for(result.player_id)};
        broadcast_to_room(room, build_packet(MessageType::PlayerJoined, joined));
    }
}

void Server::on_request_state_full(std::shared_ptr<Session> session, const RequestStateFullMsg& msg) {
    Room* room = rooms_.room_for_connection(session->id());
    if (!room) {
        send_error(*session, "Room not found");
        return;
    }
    if (!msg.room_id.empty() && msg.room_id != room->room_id()) {
        send_error(*session, "Not a member of room " + msg.room_id);
        return;
    }

    StateBroadcaster& broadcaster = broadcaster_for(room->room_id());
    session->send(build_packet(MessageType::StateFull, broadcaster.snapshot_for_new_client(room->state())));
}

void Server::on_input(std::shared_ptr<Session> session, const InputMsg& msg) {
    try {
        rooms_.handle_input(session->id(), msg);
    } catch (const std::runtime_error& e) {
        send_error(*session, e.what());
    }
}

void Server::on_update_username(std::shared_ptr<Session> session, const UsernameUpdateMsg& msg) {
    UsernameResult result;
    try {
        result = rooms_.handle_username_update(session->id(), msg);
    } catch (const std::runtime_error& e) {
        send_error(*session, e.what());
        return;
    }

    PlayerEventMsg updated{result.room->room_id(), result.player_id, result.username};
    broadcast_to_room(*result.room, build_packet(MessageType::PlayerUpdated, updated));
}

void Server::on_radio_cycle(std::shared_ptr<Session> session, const RadioCycleMsg& msg) {
    Room* room = rooms_.room_for_connection(session->id());
    if (room && !msg.room_id.empty() && msg.room_id != room->room_id()) {
        send_error(*session, "Not a member of room " + msg.room_id);
        return;
    }
    try {
        rooms_.handle_radio_cycle(session->id());
    } catch (const std::runtime_error& e) {
        send_error(*session, e.what());
    }
    // The new radio state goes out with the next broadcast
}

void Server::on_disconnect(ConnectionId id) {
    sessions_.erase(id);
    std::cout << "[Server] Connection " << id << " closed" << std::endl;

    DisconnectResult result = rooms_.handle_disconnect(id);

    for (const auto& removed : result.removed_players) {
        Room* room = rooms_.find_room(removed.room_id);
        if (!room) continue;
        PlayerEventMsg left{removed.room_id, removed.player_id, removed.username};
        broadcast_to_room(*room, build_packet(MessageType::PlayerLeft, left));
    }

    for (ConnectionId controller : result.orphaned_controllers) {
        auto it = sessions_.find(controller);
        if (it != sessions_.end()) {
            send_error(*it->second, "Player left the room");
        }
    }

    for (const auto& room_id : result.deleted_rooms) {
        broadcasters_.erase(room_id);
    }
}

void Server::game_loop() {
    if (!running_) return;

    auto now = std::chrono::steady_clock::now();
    double dt = std::chrono::duration<double>(now - last_tick_).count();
    last_tick_ = now;

    rooms_.update(dt);

    double broadcast_interval = 1.0 / std::max(1.0f, config_.server().broadcast_rate);
    broadcast_accumulator_ += dt;
    if (broadcast_accumulator_ >= broadcast_interval) {
        // Never let a stall queue up a burst of broadcasts
        broadcast_accumulator_ = std::min(broadcast_accumulator_ - broadcast_interval, broadcast_interval);
        broadcast_room_states();
    }

    float tick_duration = 1.0f / std::max(1.0f, config_.server().tick_rate);
    tick_timer_.expires_after(std::chrono::microseconds(static_cast<int64_t>(tick_duration * 1000000.0f)));
    tick_timer_.async_wait([this](asio::error_code ec) {
        if (!ec && running_) {
            game_loop();
        }
    });
}

void Server::broadcast_room_states() {
    for (Room* room : rooms_.rooms()) {
        auto update = broadcaster_for(room->room_id()).next(room->state());
        if (!update) continue;
        broadcast_to_room(*room, build_packet(update->type, update->payload));
    }
}

StateBroadcaster& Server::broadcaster_for(const std::string& room_id) {
    auto it = broadcasters_.find(room_id);
    if (it == broadcasters_.end()) {
        BroadcastConfig broadcast_config;
        broadcast_config.number_precision = config_.network().number_precision;
        broadcast_config.thresholds = config_.network().delta_thresholds();
        it = broadcasters_.emplace(room_id, StateBroadcaster(broadcast_config)).first;
    }
    return it->second;
}

void Server::send_to(ConnectionId id, const std::vector<uint8_t>& data) {
    auto it = sessions_.find(id);
    if (it != sessions_.end() && it->second->is_open()) {
        it->second->send(data);
    }
}

void Server::broadcast_to_room(const Room& room, const std::vector<uint8_t>& data) {
    for (ConnectionId id : room.connections()) {
        send_to(id, data);
    }
}

void Server::send_error(Session& session, const std::string& message) {
    std::cout << "[Server] Connection " << session.id() << " error: " << message << std::endl;
    session.send(build_packet(MessageType::ErrorMessage, ErrorMsg{message}));
}

} // namespace racesync::server
