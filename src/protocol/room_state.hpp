#pragma once

#include "protocol/json_fields.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace racesync::protocol {

// Coordinate system: x,z form the horizontal ground plane. Angles in radians.

struct CarState {
    std::string player_id;
    std::string username;  // Empty when the server did not supply one
    double x = 0.0;
    double z = 0.0;
    double angle = 0.0;
    double speed = 0.0;
    bool is_npc = false;
    bool turbo_active = false;
    int turbo_charges = 0;
    double turbo_recharge = 0.0;
    double turbo_duration_left = 0.0;
    int missile_charges = 0;
    double missile_recharge = 0.0;
    double impact_spin_time_left = 0.0;

    bool operator==(const CarState&) const = default;
};

struct MissileState {
    std::string id;
    std::string owner_id;
    double x = 0.0;
    double z = 0.0;
    double angle = 0.0;
    double speed = 0.0;
    std::string target_id;  // Empty = no lock

    bool operator==(const MissileState&) const = default;
};

enum class ItemType : uint8_t {
    Nitro = 0,
    Shoot = 1,
};

struct ItemState {
    std::string id;
    ItemType type = ItemType::Nitro;
    double x = 0.0;
    double z = 0.0;
    double angle = 0.0;

    bool operator==(const ItemState&) const = default;
};

struct RadioState {
    bool enabled = false;
    int station_index = 0;

    bool operator==(const RadioState&) const = default;
};

enum class RacePhase : uint8_t {
    Lobby = 0,
    Countdown = 1,
    Race = 2,
    Finished = 3,
    PostRace = 4,
};

struct LeaderboardEntry {
    std::string player_id;
    std::string username;
    int position = 0;
    int lap = 0;
    double total_distance = 0.0;
    std::optional<double> gap_to_first;
    bool finished = false;
    std::optional<double> finish_time;
    bool is_npc = false;

    bool operator==(const LeaderboardEntry&) const = default;
};

struct RacePlayer {
    std::string player_id;
    std::string username;
    bool is_npc = false;
    int lap = 0;
    double progress_on_lap = 0.0;
    double total_distance = 0.0;
    bool finished = false;
    std::optional<double> finish_time;

    bool operator==(const RacePlayer&) const = default;
};

struct RaceState {
    RacePhase phase = RacePhase::Lobby;
    int laps_required = 3;
    std::optional<double> countdown_remaining;
    std::optional<double> countdown_total;
    std::optional<double> finish_timeout_remaining;
    std::optional<double> post_race_remaining;
    int start_segment_index = 0;
    std::vector<LeaderboardEntry> leaderboard;
    std::vector<RacePlayer> players;

    bool operator==(const RaceState&) const = default;
};

struct RoomState {
    std::string room_id;
    std::string track_id;
    double server_time = 0.0;
    std::vector<CarState> cars;
    std::vector<MissileState> missiles;
    std::vector<ItemState> items;
    RadioState radio;
    RaceState race;

    bool operator==(const RoomState&) const = default;
};

// Identity keys for the keyed collections
inline const std::string& entity_key(const CarState& car) { return car.player_id; }
inline const std::string& entity_key(const MissileState& missile) { return missile.id; }
inline const std::string& entity_key(const ItemState& item) { return item.id; }

inline const char* to_string(ItemType type) {
    return type == ItemType::Shoot ? "shoot" : "nitro";
}

inline ItemType item_type_from_string(const std::string& s) {
    return s == "shoot" ? ItemType::Shoot : ItemType::Nitro;
}

inline const char* to_string(RacePhase phase) {
    switch (phase) {
        case RacePhase::Lobby:     return "lobby";
        case RacePhase::Countdown: return "countdown";
        case RacePhase::Race:      return "race";
        case RacePhase::Finished:  return "finished";
        case RacePhase::PostRace:  return "postrace";
    }
    return "lobby";
}

inline RacePhase race_phase_from_string(const std::string& s) {
    if (s == "countdown") return RacePhase::Countdown;
    if (s == "race") return RacePhase::Race;
    if (s == "finished") return RacePhase::Finished;
    if (s == "postrace") return RacePhase::PostRace;
    return RacePhase::Lobby;
}

// ============================================================================
// JSON codecs (nlohmann ADL hooks). Decoding never throws on missing or
// mistyped fields; see json_fields.hpp.
// ============================================================================

inline void to_json(json& j, const CarState& car) {
    j = json{
        {"playerId", car.player_id},
        {"x", car.x},
        {"z", car.z},
        {"angle", car.angle},
        {"speed", car.speed},
        {"isNpc", car.is_npc},
        {"turboActive", car.turbo_active},
        {"turboCharges", car.turbo_charges},
        {"turboRecharge", car.turbo_recharge},
        {"turboDurationLeft", car.turbo_duration_left},
        {"missileCharges", car.missile_charges},
        {"missileRecharge", car.missile_recharge},
        {"impactSpinTimeLeft", car.impact_spin_time_left},
    };
    write_if_not_empty(j, "username", car.username);
}

inline void from_json(const json& j, CarState& car) {
    car = CarState{};
    read_field(j, "playerId", car.player_id);
    read_field(j, "username", car.username);
    read_field(j, "x", car.x);
    read_field(j, "z", car.z);
    read_field(j, "angle", car.angle);
    read_field(j, "speed", car.speed);
    read_field(j, "isNpc", car.is_npc);
    read_field(j, "turboActive", car.turbo_active);
    read_field(j, "turboCharges", car.turbo_charges);
    read_field(j, "turboRecharge", car.turbo_recharge);
    read_field(j, "turboDurationLeft", car.turbo_duration_left);
    read_field(j, "missileCharges", car.missile_charges);
    read_field(j, "missileRecharge", car.missile_recharge);
    read_field(j, "impactSpinTimeLeft", car.impact_spin_time_left);
}

inline void to_json(json& j, const MissileState& missile) {
    j = json{
        {"id", missile.id},
        {"ownerId", missile.owner_id},
        {"x", missile.x},
        {"z", missile.z},
        {"angle", missile.angle},
        {"speed", missile.speed},
    };
    write_if_not_empty(j, "targetId", missile.target_id);
}

inline void from_json(const json& j, MissileState& missile) {
    missile = MissileState{};
    read_field(j, "id", missile.id);
    read_field(j, "ownerId", missile.owner_id);
    read_field(j, "x", missile.x);
    read_field(j, "z", missile.z);
    read_field(j, "angle", missile.angle);
    read_field(j, "speed", missile.speed);
    read_field(j, "targetId", missile.target_id);
}

inline void to_json(json& j, const ItemState& item) {
    j = json{
        {"id", item.id},
        {"type", to_string(item.type)},
        {"x", item.x},
        {"z", item.z},
        {"angle", item.angle},
    };
}

inline void from_json(const json& j, ItemState& item) {
    item = ItemState{};
    read_field(j, "id", item.id);
    std::string type;
    if (read_field(j, "type", type)) {
        item.type = item_type_from_string(type);
    }
    read_field(j, "x", item.x);
    read_field(j, "z", item.z);
    read_field(j, "angle", item.angle);
}

inline void to_json(json& j, const RadioState& radio) {
    j = json{{"enabled", radio.enabled}, {"stationIndex", radio.station_index}};
}

inline void from_json(const json& j, RadioState& radio) {
    radio = RadioState{};
    read_field(j, "enabled", radio.enabled);
    read_field(j, "stationIndex", radio.station_index);
}

inline void to_json(json& j, const LeaderboardEntry& entry) {
    j = json{
        {"playerId", entry.player_id},
        {"position", entry.position},
        {"lap", entry.lap},
        {"totalDistance", entry.total_distance},
        {"finished", entry.finished},
        {"isNpc", entry.is_npc},
    };
    write_if_not_empty(j, "username", entry.username);
    write_nullable(j, "gapToFirst", entry.gap_to_first);
    write_optional(j, "finishTime", entry.finish_time);
}

inline void from_json(const json& j, LeaderboardEntry& entry) {
    entry = LeaderboardEntry{};
    read_field(j, "playerId", entry.player_id);
    read_field(j, "username", entry.username);
    read_field(j, "position", entry.position);
    read_field(j, "lap", entry.lap);
    read_field(j, "totalDistance", entry.total_distance);
    read_nullable(j, "gapToFirst", entry.gap_to_first);
    read_field(j, "finished", entry.finished);
    read_nullable(j, "finishTime", entry.finish_time);
    read_field(j, "isNpc", entry.is_npc);
}

inline void to_json(json& j, const RacePlayer& player) {
    j = json{
        {"playerId", player.player_id},
        {"isNpc", player.is_npc},
        {"lap", player.lap},
        {"progressOnLap", player.progress_on_lap},
        {"totalDistance", player.total_distance},
        {"finished", player.finished},
    };
    write_if_not_empty(j, "username", player.username);
    write_optional(j, "finishTime", player.finish_time);
}

inline void from_json(const json& j, RacePlayer& player) {
    player = RacePlayer{};
    read_field(j, "playerId", player.player_id);
    read_field(j, "username", player.username);
    read_field(j, "isNpc", player.is_npc);
    read_field(j, "lap", player.lap);
    read_field(j, "progressOnLap", player.progress_on_lap);
    read_field(j, "totalDistance", player.total_distance);
    read_field(j, "finished", player.finished);
    read_nullable(j, "finishTime", player.finish_time);
}

// Arrays of entities: non-array values decode to empty, non-object elements are skipped
template<typename T>
std::vector<T> read_entity_array(const json& j, const char* key) {
    std::vector<T> out;
    if (!j.is_object()) return out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    out.reserve(it->size());
    for (const auto& element : *it) {
        if (element.is_object()) {
            out.push_back(element.get<T>());
        }
    }
    return out;
}

inline std::vector<std::string> read_string_array(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object()) return out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& element : *it) {
        if (element.is_string()) {
            out.push_back(element.get<std::string>());
        }
    }
    return out;
}

inline void to_json(json& j, const RaceState& race) {
    j = json{
        {"phase", to_string(race.phase)},
        {"lapsRequired", race.laps_required},
        {"startSegmentIndex", race.start_segment_index},
        {"leaderboard", race.leaderboard},
        {"players", race.players},
    };
    write_nullable(j, "countdownRemaining", race.countdown_remaining);
    write_nullable(j, "countdownTotal", race.countdown_total);
    write_nullable(j, "finishTimeoutRemaining", race.finish_timeout_remaining);
    write_nullable(j, "postRaceRemaining", race.post_race_remaining);
}

inline void from_json(const json& j, RaceState& race) {
    race = RaceState{};
    std::string phase;
    if (read_field(j, "phase", phase)) {
        race.phase = race_phase_from_string(phase);
    }
    read_field(j, "lapsRequired", race.laps_required);
    read_nullable(j, "countdownRemaining", race.countdown_remaining);
    read_nullable(j, "countdownTotal", race.countdown_total);
    read_nullable(j, "finishTimeoutRemaining", race.finish_timeout_remaining);
    read_nullable(j, "postRaceRemaining", race.post_race_remaining);
    read_field(j, "startSegmentIndex", race.start_segment_index);
    race.leaderboard = read_entity_array<LeaderboardEntry>(j, "leaderboard");
    race.players = read_entity_array<RacePlayer>(j, "players");
}

inline void to_json(json& j, const RoomState& state) {
    j = json{
        {"roomId", state.room_id},
        {"trackId", state.track_id},
        {"serverTime", state.server_time},
        {"cars", state.cars},
        {"missiles", state.missiles},
        {"items", state.items},
        {"radio", state.radio},
        {"race", state.race},
    };
}

inline void from_json(const json& j, RoomState& state) {
    state = RoomState{};
    read_field(j, "roomId", state.room_id);
    read_field(j, "trackId", state.track_id);
    read_field(j, "serverTime", state.server_time);
    state.cars = read_entity_array<CarState>(j, "cars");
    state.missiles = read_entity_array<MissileState>(j, "missiles");
    state.items = read_entity_array<ItemState>(j, "items");
    if (j.contains("radio") && j["radio"].is_object()) {
        state.radio = j["radio"].get<RadioState>();
    }
    if (j.contains("race") && j["race"].is_object()) {
        state.race = j["race"].get<RaceState>();
    }
}

} // namespace racesync::protocol
