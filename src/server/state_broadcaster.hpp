#pragma once

#include "protocol/message_type.hpp"
#include "protocol/room_state.hpp"
#include "server/state_diff.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace racesync::server {

struct BroadcastConfig {
    int number_precision = 3;
    DeltaThresholds thresholds;
};

struct StateUpdate {
    protocol::MessageType type = protocol::MessageType::StateFull;
    nlohmann::json payload;
};

// Decides, per room, what the next broadcast carries: a full snapshot, a
// delta against the last broadcast, or nothing. Every outgoing state is
// rounded first so the delta never carries sub-precision noise.
class StateBroadcaster {
public:
    explicit StateBroadcaster(const BroadcastConfig& config);

    // nullopt when nothing worth sending changed since the last broadcast
    std::optional<StateUpdate> next(const protocol::RoomState& state, bool force_full = false);

    // Snapshot for a client that has no base yet. Returns the last broadcast
    // state when there is one, so the client's next delta applies cleanly.
    protocol::RoomState snapshot_for_new_client(const protocol::RoomState& current) const;

    const protocol::RoomState* last_sent() const { return last_sent_ ? &*last_sent_ : nullptr; }
    void reset() { last_sent_.reset(); }

    size_t full_snapshots_sent() const { return full_count_; }
    size_t deltas_sent() const { return delta_count_; }

private:
    BroadcastConfig config_;
    std::optional<protocol::RoomState> last_sent_;
    size_t full_count_ = 0;
    size_t delta_count_ = 0;
};

} // namespace racesync::server
