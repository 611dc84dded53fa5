#pragma once

#include "client/motion_smoothing.hpp"
#include "protocol/messages.hpp"
#include "protocol/protocol.hpp"
#include <cstdint>
#include <string>

namespace racesync::client {

struct ClientConfig {
    std::string host = "localhost";
    uint16_t port = protocol::DEFAULT_PORT;
    protocol::PlayerRole role = protocol::PlayerRole::Viewer;
    std::string room_id;
    std::string player_id;
    std::string session_token;
    std::string username;
    float frame_rate = 60.0f;
    // Seconds between status lines; 0 disables them
    float status_interval = 2.0f;
    SmoothingConfig smoothing;

    // Missing keys keep their defaults. Returns false if the file is missing
    // or unparseable.
    bool load(const std::string& path);
};

} // namespace racesync::client
