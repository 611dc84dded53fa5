#pragma once

#include "protocol/protocol.hpp"
#include "server/game_config.hpp"
#include "server/room_manager.hpp"
#include "server/session.hpp"
#include "server/state_broadcaster.hpp"
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace racesync::server {

// Accepts connections, routes their messages to the RoomManager and runs the
// fixed-rate game loop. Broadcasts are throttled to broadcast_rate and go
// through one StateBroadcaster per room.
// Everything runs on a single io_context thread.
class Server {
public:
    using tcp = asio::ip::tcp;

    Server(asio::io_context& io_context, uint16_t port, const GameConfig& config);
    ~Server();

    void start();
    void stop();

    void on_join_room(std::shared_ptr<Session> session, const protocol::JoinRoomMsg& msg);
    void on_request_state_full(std::shared_ptr<Session> session, const protocol::RequestStateFullMsg& msg);
    void on_input(std::shared_ptr<Session> session, const protocol::InputMsg& msg);
    void on_update_username(std::shared_ptr<Session> session, const protocol::UsernameUpdateMsg& msg);
    void on_radio_cycle(std::shared_ptr<Session> session, const protocol::RadioCycleMsg& msg);
    void on_disconnect(ConnectionId id);

    RoomManager& rooms() { return rooms_; }
    uint16_t port() const;

private:
    void accept();
    void game_loop();
    void broadcast_room_states();

    StateBroadcaster& broadcaster_for(const std::string& room_id);
    void send_to(ConnectionId id, const std::vector<uint8_t>& data);
    void broadcast_to_room(const Room& room, const std::vector<uint8_t>& data);
    void send_error(Session& session, const std::string& message);

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    const GameConfig& config_;
    RoomManager rooms_;

    std::unordered_map<ConnectionId, std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, StateBroadcaster> broadcasters_;
    ConnectionId next_connection_id_ = 1;

    asio::steady_timer tick_timer_;
    bool running_ = false;

    std::chrono::steady_clock::time_point last_tick_;
    double broadcast_accumulator_ = 0.0;
};

} // namespace racesync::server
