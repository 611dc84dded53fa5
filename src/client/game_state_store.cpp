#include "game_state_store.hpp"
#include <algorithm>
#include <unordered_set>

namespace racesync::client {

using namespace racesync::protocol;

namespace {

const std::vector<CarState> empty_cars;
const std::vector<MissileState> empty_missiles;
const std::vector<ItemState> empty_items;

} // anonymous namespace

void GameStateStore::set_room_info(const std::string& room_id, const std::string& player_id,
                                   const TrackData& track,
                                   const std::vector<PlayerSummary>& players) {
    room_id_ = room_id;
    player_id_ = player_id;
    track_ = track;

    players_.clear();
    players_.reserve(players.size());
    for (const auto& player : players) {
        players_.push_back(normalize(player));
    }
    notify_room_info();
}

void GameStateStore::update_state(const RoomState& state) {
    bool roster_changed = merge_players_from_state(state);
    state_ = state;
    last_state_time_ = Clock::now();

    if (roster_changed) {
        notify_room_info();
    }
    state_listeners_.notify(*state_);
}

void GameStateStore::update_player(const PlayerSummary& player) {
    if (player.player_id.empty()) return;
    if (upsert_players({player})) {
        notify_room_info();
    }
}

void GameStateStore::update_player_username(const std::string& player_id, const std::string& username) {
    if (player_id.empty()) return;
    PlayerSummary update{player_id, username, false};
    auto it = std::find_if(players_.begin(), players_.end(),
                           [&](const PlayerSummary& p) { return p.player_id == player_id; });
    if (it != players_.end()) {
        update.is_npc = it->is_npc;
    }
    update_player(update);
}

void GameStateStore::remove_player(const std::string& player_id) {
    auto it = std::find_if(players_.begin(), players_.end(),
                           [&](const PlayerSummary& p) { return p.player_id == player_id; });
    if (it == players_.end()) return;
    players_.erase(it);
    notify_room_info();
}

GameStateStore::Unsubscribe GameStateStore::on_room_info(RoomInfoCallback callback) {
    if (!room_id_.empty()) {
        callback(room_info_snapshot());
    }
    return room_info_listeners_.subscribe(std::move(callback));
}

GameStateStore::Unsubscribe GameStateStore::on_state(StateCallback callback) {
    if (state_) {
        callback(*state_);
    }
    return state_listeners_.subscribe(std::move(callback));
}

const std::vector<CarState>& GameStateStore::cars() const {
    return state_ ? state_->cars : empty_cars;
}

const std::vector<MissileState>& GameStateStore::missiles() const {
    return state_ ? state_->missiles : empty_missiles;
}

const std::vector<ItemState>& GameStateStore::items() const {
    return state_ ? state_->items : empty_items;
}

std::string GameStateStore::username_for(const std::string& player_id) const {
    for (const auto& player : players_) {
        if (player.player_id == player_id) {
            return player.username;
        }
    }
    return player_id;
}

RoomInfoSnapshot GameStateStore::room_info_snapshot() const {
    return RoomInfoSnapshot{room_id_, player_id_, track_, players_};
}

void GameStateStore::notify_room_info() {
    room_info_listeners_.notify(room_info_snapshot());
}

PlayerSummary GameStateStore::normalize(const PlayerSummary& player) const {
    PlayerSummary out = player;
    if (out.username.empty()) {
        out.username = out.player_id;
    }
    return out;
}

bool GameStateStore::upsert_players(const std::vector<PlayerSummary>& updates) {
    bool changed = false;
    for (const auto& update : updates) {
        PlayerSummary normalized = normalize(update);
        auto it = std::find_if(players_.begin(), players_.end(),
                               [&](const PlayerSummary& p) { return p.player_id == normalized.player_id; });
        if (it == players_.end()) {
            players_.push_back(std::move(normalized));
            changed = true;
        } else if (it->username != normalized.username || it->is_npc != normalized.is_npc) {
            *it = std::move(normalized);
            changed = true;
        }
    }
    return changed;
}

bool GameStateStore::merge_players_from_state(const RoomState& state) {
    std::vector<PlayerSummary> updates;
    updates.reserve(state.cars.size() + state.race.players.size());

    // A snapshot without a username keeps whatever name the roster already has
    auto harvest = [&](const std::string& player_id, const std::string& username, bool is_npc) {
        if (player_id.empty()) return;
        PlayerSummary summary{player_id, username, is_npc};
        if (summary.username.empty()) {
            summary.username = username_for(player_id);
        }
        updates.push_back(std::move(summary));
    };
    for (const auto& car : state.cars) {
        harvest(car.player_id, car.username, car.is_npc);
    }
    for (const auto& player : state.race.players) {
        harvest(player.player_id, player.username, player.is_npc);
    }

    bool changed = upsert_players(updates);

    std::unordered_set<std::string> seen;
    for (const auto& update : updates) {
        seen.insert(update.player_id);
    }
    auto removed_begin = std::remove_if(players_.begin(), players_.end(),
                                        [&](const PlayerSummary& p) { return !seen.count(p.player_id); });
    if (removed_begin != players_.end()) {
        players_.erase(removed_begin, players_.end());
        changed = true;
    }
    return changed;
}

} // namespace racesync::client
