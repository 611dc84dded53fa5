#pragma once

#include "protocol/room_state.hpp"

namespace racesync::server {

// Round a double to `precision` decimal places for the wire.
// Non-finite values become 0; precision <= 0 leaves finite values untouched.
double round_number(double value, int precision);

// Copy of `state` with every continuous quantity rounded. Diffing rounded
// states keeps sub-precision jitter out of deltas.
protocol::RoomState serialize_room_state(const protocol::RoomState& state, int precision);

} // namespace racesync::server
