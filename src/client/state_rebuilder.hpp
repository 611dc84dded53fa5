#pragma once

#include "protocol/room_state.hpp"
#include "protocol/room_state_delta.hpp"
#include <optional>

namespace racesync::client {

// Merge a delta onto the last reconciled snapshot.
// Returns nullopt when there is no base to merge onto; the caller must then
// request a full snapshot. Pure: neither argument is modified.
std::optional<protocol::RoomState> apply_room_state_delta(
    const protocol::RoomState* base,
    const protocol::RoomStateDelta& delta);

} // namespace racesync::client
