#pragma once

#include "common/observer_registry.hpp"
#include "protocol/messages.hpp"
#include "protocol/room_state.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace racesync::client {

struct RoomInfoSnapshot {
    std::string room_id;
    std::string player_id;
    std::optional<protocol::TrackData> track;
    std::vector<protocol::PlayerSummary> players;
};

// Client-side holder of the current room snapshot and the player roster.
// Subscribers get the last known value replayed synchronously on subscribe,
// then every later value. Single-threaded: call from the frame loop only.
class GameStateStore {
public:
    using RoomInfoCallback = std::function<void(const RoomInfoSnapshot&)>;
    using StateCallback = std::function<void(const protocol::RoomState&)>;
    using Unsubscribe = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    void set_room_info(const std::string& room_id, const std::string& player_id,
                       const protocol::TrackData& track,
                       const std::vector<protocol::PlayerSummary>& players);

    void update_state(const protocol::RoomState& state);

    void update_player(const protocol::PlayerSummary& player);
    // Sets the display name only; an existing entry keeps its is_npc flag
    void update_player_username(const std::string& player_id, const std::string& username);
    void remove_player(const std::string& player_id);

    Unsubscribe on_room_info(RoomInfoCallback callback);
    Unsubscribe on_state(StateCallback callback);

    const std::string& room_id() const { return room_id_; }
    const std::string& player_id() const { return player_id_; }
    const protocol::TrackData* track() const { return track_ ? &*track_ : nullptr; }
    const std::vector<protocol::PlayerSummary>& players() const { return players_; }

    // Null until the first snapshot arrives
    const protocol::RoomState* state() const { return state_ ? &*state_ : nullptr; }
    const std::vector<protocol::CarState>& cars() const;
    const std::vector<protocol::MissileState>& missiles() const;
    const std::vector<protocol::ItemState>& items() const;
    const protocol::RaceState* race() const { return state_ ? &state_->race : nullptr; }

    // Falls back to the id for unknown players
    std::string username_for(const std::string& player_id) const;

    std::optional<Clock::time_point> last_state_time() const { return last_state_time_; }

private:
    RoomInfoSnapshot room_info_snapshot() const;
    void notify_room_info();

    protocol::PlayerSummary normalize(const protocol::PlayerSummary& player) const;
    bool upsert_players(const std::vector<protocol::PlayerSummary>& updates);
    bool merge_players_from_state(const protocol::RoomState& state);

    std::string room_id_;
    std::string player_id_;
    std::optional<protocol::TrackData> track_;
    std::vector<protocol::PlayerSummary> players_;
    std::optional<protocol::RoomState> state_;
    std::optional<Clock::time_point> last_state_time_;

    ObserverRegistry<RoomInfoSnapshot> room_info_listeners_;
    ObserverRegistry<protocol::RoomState> state_listeners_;
};

} // namespace racesync::client
