#pragma once

// Umbrella header for the wire protocol

#include "protocol/message_type.hpp"
#include "protocol/packet.hpp"
#include "protocol/room_state.hpp"
#include "protocol/room_state_delta.hpp"
#include "protocol/messages.hpp"

#include <cstdint>

namespace racesync::protocol {

// Bumped whenever a message shape changes incompatibly
constexpr int PROTOCOL_VERSION = 1;

// Default port for CLI usage (not game logic)
constexpr uint16_t DEFAULT_PORT = 4000;

} // namespace racesync::protocol
