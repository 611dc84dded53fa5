#pragma once

#include "protocol/room_state.hpp"
#include <optional>
#include <string>
#include <vector>

namespace racesync::protocol {

// Partial update for a car. Unset fields keep the base value.
struct CarPatch {
    std::string player_id;
    std::optional<std::string> username;
    std::optional<double> x;
    std::optional<double> z;
    std::optional<double> angle;
    std::optional<double> speed;
    std::optional<bool> is_npc;
    std::optional<bool> turbo_active;
    std::optional<int> turbo_charges;
    std::optional<double> turbo_recharge;
    std::optional<double> turbo_duration_left;
    std::optional<int> missile_charges;
    std::optional<double> missile_recharge;
    std::optional<double> impact_spin_time_left;

    bool operator==(const CarPatch&) const = default;
};

struct MissilePatch {
    std::string id;
    std::optional<std::string> owner_id;
    std::optional<double> x;
    std::optional<double> z;
    std::optional<double> angle;
    std::optional<double> speed;
    std::optional<std::string> target_id;

    bool operator==(const MissilePatch&) const = default;
};

template<typename State, typename Patch>
struct EntityDelta {
    std::vector<State> added;
    std::vector<Patch> updated;
    std::vector<std::string> removed;

    bool empty() const { return added.empty() && updated.empty() && removed.empty(); }
    size_t change_count() const { return added.size() + updated.size() + removed.size(); }

    bool operator==(const EntityDelta&) const = default;
};

using CarDelta = EntityDelta<CarState, CarPatch>;
using MissileDelta = EntityDelta<MissileState, MissilePatch>;

// Items are spawned and picked up whole, never partially mutated
struct ItemDelta {
    std::vector<ItemState> added;
    std::vector<std::string> removed;

    bool empty() const { return added.empty() && removed.empty(); }
    size_t change_count() const { return added.size() + removed.size(); }

    bool operator==(const ItemDelta&) const = default;
};

// Every member is a present-or-absent override; absence means "unchanged"
struct RoomStateDelta {
    std::optional<std::string> room_id;
    std::optional<std::string> track_id;
    std::optional<double> server_time;
    std::optional<CarDelta> cars;
    std::optional<MissileDelta> missiles;
    std::optional<ItemDelta> items;
    std::optional<RadioState> radio;
    std::optional<RaceState> race;

    bool operator==(const RoomStateDelta&) const = default;
};

// ============================================================================
// Per-field merge
// ============================================================================

template<typename T>
inline void merge_field(T& target, const std::optional<T>& value) {
    if (value) {
        target = *value;
    }
}

inline const std::string& entity_key(const CarPatch& patch) { return patch.player_id; }
inline const std::string& entity_key(const MissilePatch& patch) { return patch.id; }

inline void apply_patch(CarState& car, const CarPatch& patch) {
    merge_field(car.username, patch.username);
    merge_field(car.x, patch.x);
    merge_field(car.z, patch.z);
    merge_field(car.angle, patch.angle);
    merge_field(car.speed, patch.speed);
    merge_field(car.is_npc, patch.is_npc);
    merge_field(car.turbo_active, patch.turbo_active);
    merge_field(car.turbo_charges, patch.turbo_charges);
    merge_field(car.turbo_recharge, patch.turbo_recharge);
    merge_field(car.turbo_duration_left, patch.turbo_duration_left);
    merge_field(car.missile_charges, patch.missile_charges);
    merge_field(car.missile_recharge, patch.missile_recharge);
    merge_field(car.impact_spin_time_left, patch.impact_spin_time_left);
}

inline void apply_patch(MissileState& missile, const MissilePatch& patch) {
    merge_field(missile.owner_id, patch.owner_id);
    merge_field(missile.x, patch.x);
    merge_field(missile.z, patch.z);
    merge_field(missile.angle, patch.angle);
    merge_field(missile.speed, patch.speed);
    merge_field(missile.target_id, patch.target_id);
}

// A patch for an id the base does not know becomes a fresh entity with defaults
inline CarState materialize(const CarPatch& patch) {
    CarState car;
    car.player_id = patch.player_id;
    apply_patch(car, patch);
    return car;
}

inline MissileState materialize(const MissilePatch& patch) {
    MissileState missile;
    missile.id = patch.id;
    apply_patch(missile, patch);
    return missile;
}

// ============================================================================
// JSON codecs
// ============================================================================

inline void to_json(json& j, const CarPatch& patch) {
    j = json{{"playerId", patch.player_id}};
    write_optional(j, "username", patch.username);
    write_optional(j, "x", patch.x);
    write_optional(j, "z", patch.z);
    write_optional(j, "angle", patch.angle);
    write_optional(j, "speed", patch.speed);
    write_optional(j, "isNpc", patch.is_npc);
    write_optional(j, "turboActive", patch.turbo_active);
    write_optional(j, "turboCharges", patch.turbo_charges);
    write_optional(j, "turboRecharge", patch.turbo_recharge);
    write_optional(j, "turboDurationLeft", patch.turbo_duration_left);
    write_optional(j, "missileCharges", patch.missile_charges);
    write_optional(j, "missileRecharge", patch.missile_recharge);
    write_optional(j, "impactSpinTimeLeft", patch.impact_spin_time_left);
}

inline void from_json(const json& j, CarPatch& patch) {
    patch = CarPatch{};
    read_field(j, "playerId", patch.player_id);
    read_optional(j, "username", patch.username);
    read_optional(j, "x", patch.x);
    read_optional(j, "z", patch.z);
    read_optional(j, "angle", patch.angle);
    read_optional(j, "speed", patch.speed);
    read_optional(j, "isNpc", patch.is_npc);
    read_optional(j, "turboActive", patch.turbo_active);
    read_optional(j, "turboCharges", patch.turbo_charges);
    read_optional(j, "turboRecharge", patch.turbo_recharge);
    read_optional(j, "turboDurationLeft", patch.turbo_duration_left);
    read_optional(j, "missileCharges", patch.missile_charges);
    read_optional(j, "missileRecharge", patch.missile_recharge);
    read_optional(j, "impactSpinTimeLeft", patch.impact_spin_time_left);
}

inline void to_json(json& j, const MissilePatch& patch) {
    j = json{{"id", patch.id}};
    write_optional(j, "ownerId", patch.owner_id);
    write_optional(j, "x", patch.x);
    write_optional(j, "z", patch.z);
    write_optional(j, "angle", patch.angle);
    write_optional(j, "speed", patch.speed);
    write_optional(j, "targetId", patch.target_id);
}

inline void from_json(const json& j, MissilePatch& patch) {
    patch = MissilePatch{};
    read_field(j, "id", patch.id);
    read_optional(j, "ownerId", patch.owner_id);
    read_optional(j, "x", patch.x);
    read_optional(j, "z", patch.z);
    read_optional(j, "angle", patch.angle);
    read_optional(j, "speed", patch.speed);
    read_optional(j, "targetId", patch.target_id);
}

template<typename State, typename Patch>
void to_json(json& j, const EntityDelta<State, Patch>& delta) {
    j = json::object();
    if (!delta.added.empty()) j["added"] = delta.added;
    if (!delta.updated.empty()) j["updated"] = delta.updated;
    if (!delta.removed.empty()) j["removed"] = delta.removed;
}

template<typename State, typename Patch>
void from_json(const json& j, EntityDelta<State, Patch>& delta) {
    delta.added = read_entity_array<State>(j, "added");
    delta.updated = read_entity_array<Patch>(j, "updated");
    delta.removed = read_string_array(j, "removed");
}

inline void to_json(json& j, const ItemDelta& delta) {
    j = json::object();
    if (!delta.added.empty()) j["added"] = delta.added;
    if (!delta.removed.empty()) j["removed"] = delta.removed;
}

// "updated" is ignored for items even if a sender includes it
inline void from_json(const json& j, ItemDelta& delta) {
    delta.added = read_entity_array<ItemState>(j, "added");
    delta.removed = read_string_array(j, "removed");
}

inline void to_json(json& j, const RoomStateDelta& delta) {
    j = json::object();
    write_optional(j, "roomId", delta.room_id);
    write_optional(j, "trackId", delta.track_id);
    write_optional(j, "serverTime", delta.server_time);
    if (delta.cars) j["cars"] = *delta.cars;
    if (delta.missiles) j["missiles"] = *delta.missiles;
    if (delta.items) j["items"] = *delta.items;
    if (delta.radio) j["radio"] = *delta.radio;
    if (delta.race) j["race"] = *delta.race;
}

inline void from_json(const json& j, RoomStateDelta& delta) {
    delta = RoomStateDelta{};
    read_optional(j, "roomId", delta.room_id);
    read_optional(j, "trackId", delta.track_id);
    read_optional(j, "serverTime", delta.server_time);
    if (!j.is_object()) return;
    if (auto it = j.find("cars"); it != j.end() && it->is_object()) {
        delta.cars = it->get<CarDelta>();
    }
    if (auto it = j.find("missiles"); it != j.end() && it->is_object()) {
        delta.missiles = it->get<MissileDelta>();
    }
    if (auto it = j.find("items"); it != j.end() && it->is_object()) {
        delta.items = it->get<ItemDelta>();
    }
    if (auto it = j.find("radio"); it != j.end() && it->is_object()) {
        delta.radio = it->get<RadioState>();
    }
    if (auto it = j.find("race"); it != j.end() && it->is_object()) {
        delta.race = it->get<RaceState>();
    }
}

} // namespace racesync::protocol
