#include "room_sync_client.hpp"
#include "client/state_rebuilder.hpp"
#include <iostream>
#include <utility>

namespace racesync::client {

using namespace racesync::protocol;

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Joined:       return "joined";
        case ConnectionState::Synchronized: return "synchronized";
    }
    return "disconnected";
}

RoomSyncClient::RoomSyncClient(GameStateStore& store, RoomSyncConfig config, SendFunction send)
    : store_(store)
    , config_(std::move(config))
    , send_(std::move(send)) {
}

void RoomSyncClient::begin_connect() {
    state_ = ConnectionState::Connecting;
}

void RoomSyncClient::on_transport_connected() {
    if (state_ == ConnectionState::Disconnected) {
        state_ = ConnectionState::Connecting;
    }
    send_join();
}

void RoomSyncClient::on_transport_disconnected(const std::string& reason) {
    state_ = ConnectionState::Disconnected;
    std::cerr << "[RoomSync] Disconnected: " << reason << std::endl;
    disconnect_listeners_.notify(reason);
}

void RoomSyncClient::rejoin() {
    state_ = ConnectionState::Connecting;
    send_join();
    if (!config_.room_id.empty()) {
        request_full_state();
    }
}

void RoomSyncClient::send_join() {
    JoinRoomMsg join;
    join.role = config_.role;
    join.protocol_version = config_.protocol_version;
    join.room_id = config_.room_id;
    join.player_id = config_.player_id;
    join.session_token = config_.session_token;
    send_(MessageType::JoinRoom, join);
}

void RoomSyncClient::handle_frame(MessageType type, std::span<const uint8_t> payload) {
    nlohmann::json j;
    try {
        j = parse_payload(payload);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[RoomSync] Dropping malformed " << to_event_name(type) << ": " << e.what() << std::endl;
        return;
    }
    handle_message(type, j);
}

void RoomSyncClient::handle_message(MessageType type, const nlohmann::json& payload) {
    try {
        switch (type) {
            case MessageType::RoomInfo:
                handle_room_info(payload.get<RoomInfoMsg>());
                break;

            case MessageType::State:
            case MessageType::StateFull:
                handle_full_state(payload.get<RoomState>());
                break;

            case MessageType::StateDelta:
                handle_delta(payload.get<RoomStateDelta>());
                break;

            case MessageType::PlayerJoined:
            case MessageType::PlayerUpdated: {
                auto event = payload.get<PlayerEventMsg>();
                store_.update_player_username(event.player_id, event.username);
                break;
            }

            case MessageType::PlayerLeft:
                store_.remove_player(payload.get<PlayerEventMsg>().player_id);
                break;

            case MessageType::ErrorMessage:
                handle_error(payload.get<ErrorMsg>().message);
                break;

            default:
                std::cerr << "[RoomSync] Ignoring " << to_event_name(type) << std::endl;
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[RoomSync] Dropping malformed " << to_event_name(type) << ": " << e.what() << std::endl;
    }
}

void RoomSyncClient::handle_room_info(const RoomInfoMsg& info) {
    config_.room_id = info.room_id;
    config_.player_id = info.player_id;
    if (!info.session_token.empty()) {
        config_.session_token = info.session_token;
    }
    server_version_ = info.server_version;

    if (info.protocol_version && *info.protocol_version != config_.protocol_version) {
        std::cerr << "[RoomSync] Warning: server speaks protocol " << *info.protocol_version
                  << ", client speaks " << config_.protocol_version << std::endl;
    }

    state_ = ConnectionState::Joined;
    std::cout << "[RoomSync] Joined " << info.room_id << " as " << info.player_id
              << " (" << protocol::to_string(info.role) << ")" << std::endl;
    store_.set_room_info(info.room_id, info.player_id, info.track, info.players);
}

void RoomSyncClient::handle_full_state(const RoomState& state) {
    store_.update_state(state);
    state_ = ConnectionState::Synchronized;
}

void RoomSyncClient::handle_delta(const RoomStateDelta& delta) {
    if (state_ == ConnectionState::Disconnected) {
        // Stale frame drained after the transport went away
        return;
    }
    const RoomState* base = state_ == ConnectionState::Synchronized ? store_.state() : nullptr;
    auto merged = apply_room_state_delta(base, delta);
    if (!merged) {
        // No usable base: wait for a full snapshot
        state_ = ConnectionState::Joined;
        request_full_state();
        return;
    }
    store_.update_state(*merged);
    state_ = ConnectionState::Synchronized;
}

void RoomSyncClient::handle_error(const std::string& message) {
    std::cerr << "[RoomSync] Server error: " << message << std::endl;
    error_listeners_.notify(message);
}

void RoomSyncClient::send_input(double steer, double throttle, double brake,
                                const std::optional<InputActions>& actions) {
    if (config_.room_id.empty() || config_.player_id.empty()) return;
    InputMsg input;
    input.room_id = config_.room_id;
    input.player_id = config_.player_id;
    input.steer = steer;
    input.throttle = throttle;
    input.brake = brake;
    input.actions = actions;
    input.session_token = config_.session_token;
    send_(MessageType::Input, input);
}

void RoomSyncClient::update_username(const std::string& username) {
    if (config_.room_id.empty() || config_.player_id.empty()) return;
    send_(MessageType::UpdateUsername, UsernameUpdateMsg{config_.room_id, config_.player_id, username});
}

void RoomSyncClient::cycle_radio() {
    if (config_.room_id.empty()) return;
    send_(MessageType::RadioCycle, RadioCycleMsg{config_.room_id});
}

void RoomSyncClient::request_full_state() {
    ++resync_requests_;
    send_(MessageType::RequestStateFull, RequestStateFullMsg{config_.room_id});
}

} // namespace racesync::client
