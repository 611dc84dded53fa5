#pragma once

#include "client/game_state_store.hpp"
#include "common/observer_registry.hpp"
#include "protocol/protocol.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace racesync::client {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Joined,        // room_info received, no usable snapshot yet
    Synchronized,  // store holds a snapshot the next delta can apply to
};

const char* to_string(ConnectionState state);

struct RoomSyncConfig {
    protocol::PlayerRole role = protocol::PlayerRole::Viewer;
    std::string room_id;
    std::string player_id;
    std::string session_token;
    int protocol_version = protocol::PROTOCOL_VERSION;
};

// Protocol state machine for one connection. Owns no socket: outbound
// messages go through the SendFunction and inbound frames are fed in through
// handle_message(), so the same code runs over TCP or in a test.
class RoomSyncClient {
public:
    using SendFunction = std::function<void(protocol::MessageType, const nlohmann::json&)>;
    using ErrorCallback = std::function<void(const std::string&)>;
    using DisconnectCallback = std::function<void(const std::string&)>;
    using Unsubscribe = std::function<void()>;

    RoomSyncClient(GameStateStore& store, RoomSyncConfig config, SendFunction send);

    // Transport lifecycle
    void begin_connect();
    void on_transport_connected();
    void on_transport_disconnected(const std::string& reason);

    // Re-announce on an already connected transport and ask for a fresh base
    void rejoin();

    // Decode and dispatch one inbound frame. Malformed JSON is logged and dropped.
    void handle_frame(protocol::MessageType type, std::span<const uint8_t> payload);
    void handle_message(protocol::MessageType type, const nlohmann::json& payload);

    // Outbound
    void send_input(double steer, double throttle, double brake,
                    const std::optional<protocol::InputActions>& actions = std::nullopt);
    void update_username(const std::string& username);
    void cycle_radio();
    void request_full_state();

    Unsubscribe on_error(ErrorCallback callback) { return error_listeners_.subscribe(std::move(callback)); }
    Unsubscribe on_disconnect(DisconnectCallback callback) { return disconnect_listeners_.subscribe(std::move(callback)); }

    ConnectionState state() const { return state_; }
    const std::string& room_id() const { return config_.room_id; }
    const std::string& player_id() const { return config_.player_id; }
    const std::string& session_token() const { return config_.session_token; }
    const std::string& server_version() const { return server_version_; }

    size_t resync_requests() const { return resync_requests_; }

private:
    void send_join();
    void handle_room_info(const protocol::RoomInfoMsg& info);
    void handle_full_state(const protocol::RoomState& state);
    void handle_delta(const protocol::RoomStateDelta& delta);
    void handle_error(const std::string& message);

    GameStateStore& store_;
    RoomSyncConfig config_;
    SendFunction send_;

    ConnectionState state_ = ConnectionState::Disconnected;
    std::string server_version_;
    size_t resync_requests_ = 0;

    ObserverRegistry<std::string> error_listeners_;
    ObserverRegistry<std::string> disconnect_listeners_;
};

} // namespace racesync::client
