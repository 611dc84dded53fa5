#pragma once

#include "protocol/room_state.hpp"
#include "protocol/room_state_delta.hpp"
#include <cstddef>
#include <optional>

namespace racesync::server {

// Thresholds above which a full snapshot is cheaper than a delta
struct DeltaThresholds {
    double max_ratio = 0.6;
    size_t min_changes = 64;
};

// Minimal delta turning `previous` into `next`. Entity updates carry only the
// fields that differ. Returns nullopt when the two states are identical.
std::optional<protocol::RoomStateDelta> compute_state_delta(
    const protocol::RoomState& previous,
    const protocol::RoomState& next);

// True when the delta carries entity, race or radio changes. A delta that
// only advances serverTime is not worth a broadcast on its own.
bool has_broadcastable_changes(const protocol::RoomStateDelta& delta);

size_t count_changes(const protocol::RoomStateDelta& delta);

bool should_send_full_snapshot(const protocol::RoomStateDelta& delta,
                               const protocol::RoomState& previous,
                               const protocol::RoomState& next,
                               const DeltaThresholds& thresholds = {});

} // namespace racesync::server
