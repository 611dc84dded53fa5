#include "state_broadcaster.hpp"
#include "server/state_serializer.hpp"
#include <utility>

namespace racesync::server {

using namespace racesync::protocol;

StateBroadcaster::StateBroadcaster(const BroadcastConfig& config)
    : config_(config) {
}

std::optional<StateUpdate> StateBroadcaster::next(const RoomState& state, bool force_full) {
    RoomState rounded = serialize_room_state(state, config_.number_precision);

    if (!last_sent_ || force_full) {
        StateUpdate update{MessageType::StateFull, rounded};
        last_sent_ = std::move(rounded);
        ++full_count_;
        return update;
    }

    auto delta = compute_state_delta(*last_sent_, rounded);
    if (!delta || !has_broadcastable_changes(*delta)) {
        return std::nullopt;
    }

    StateUpdate update;
    if (should_send_full_snapshot(*delta, *last_sent_, rounded, config_.thresholds)) {
        update.type = MessageType::StateFull;
        update.payload = rounded;
        ++full_count_;
    } else {
        update.type = MessageType::StateDelta;
        update.payload = *delta;
        ++delta_count_;
    }
    last_sent_ = std::move(rounded);
    return update;
}

RoomState StateBroadcaster::snapshot_for_new_client(const RoomState& current) const {
    if (last_sent_) {
        return *last_sent_;
    }
    return serialize_room_state(current, config_.number_precision);
}

} // namespace racesync::server
