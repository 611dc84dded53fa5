#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace racesync::protocol {

enum class MessageType : uint8_t {
    // Client -> Server
    JoinRoom = 1,
    RequestStateFull = 2,
    Input = 3,
    UpdateUsername = 4,
    RadioCycle = 5,

    // Server -> Client (out-of-band identity)
    RoomInfo = 10,
    PlayerJoined = 11,
    PlayerUpdated = 12,
    PlayerLeft = 13,
    ErrorMessage = 14,

    // Server -> Client (state stream)
    State = 20,        // Legacy name for a full snapshot
    StateFull = 21,
    StateDelta = 22,
};

// Event names used in logs and JSON-facing tooling
inline std::string_view to_event_name(MessageType type) {
    switch (type) {
        case MessageType::JoinRoom:         return "join_room";
        case MessageType::RequestStateFull: return "request_state_full";
        case MessageType::Input:            return "input";
        case MessageType::UpdateUsername:   return "update_username";
        case MessageType::RadioCycle:       return "radio_cycle";
        case MessageType::RoomInfo:         return "room_info";
        case MessageType::PlayerJoined:     return "player_joined";
        case MessageType::PlayerUpdated:    return "player_updated";
        case MessageType::PlayerLeft:       return "player_left";
        case MessageType::ErrorMessage:     return "error_message";
        case MessageType::State:            return "state";
        case MessageType::StateFull:        return "state_full";
        case MessageType::StateDelta:       return "state_delta";
    }
    return "unknown";
}

inline std::optional<MessageType> message_type_from_event_name(std::string_view name) {
    static constexpr MessageType all[] = {
        MessageType::JoinRoom, MessageType::RequestStateFull, MessageType::Input,
        MessageType::UpdateUsername, MessageType::RadioCycle, MessageType::RoomInfo,
        MessageType::PlayerJoined, MessageType::PlayerUpdated, MessageType::PlayerLeft,
        MessageType::ErrorMessage, MessageType::State, MessageType::StateFull,
        MessageType::StateDelta,
    };
    for (MessageType type : all) {
        if (to_event_name(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

inline bool is_known_message_type(uint8_t raw) {
    switch (static_cast<MessageType>(raw)) {
        case MessageType::JoinRoom:
        case MessageType::RequestStateFull:
        case MessageType::Input:
        case MessageType::UpdateUsername:
        case MessageType::RadioCycle:
        case MessageType::RoomInfo:
        case MessageType::PlayerJoined:
        case MessageType::PlayerUpdated:
        case MessageType::PlayerLeft:
        case MessageType::ErrorMessage:
        case MessageType::State:
        case MessageType::StateFull:
        case MessageType::StateDelta:
            return true;
    }
    return false;
}

} // namespace racesync::protocol
