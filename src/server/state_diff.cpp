#include "state_diff.hpp"
#include <algorithm>
#include <string>
#include <unordered_map>

namespace racesync::server {

using namespace protocol;

namespace {

template<typename T>
bool diff_field(std::optional<T>& out, const T& previous, const T& next) {
    if (previous == next) return false;
    out = next;
    return true;
}

std::optional<CarPatch> diff_car(const CarState& previous, const CarState& next) {
    CarPatch patch;
    patch.player_id = next.player_id;
    bool changed = false;
    changed |= diff_field(patch.username, previous.username, next.username);
    changed |= diff_field(patch.x, previous.x, next.x);
    changed |= diff_field(patch.z, previous.z, next.z);
    changed |= diff_field(patch.angle, previous.angle, next.angle);
    changed |= diff_field(patch.speed, previous.speed, next.speed);
    changed |= diff_field(patch.is_npc, previous.is_npc, next.is_npc);
    changed |= diff_field(patch.turbo_active, previous.turbo_active, next.turbo_active);
    changed |= diff_field(patch.turbo_charges, previous.turbo_charges, next.turbo_charges);
    changed |= diff_field(patch.turbo_recharge, previous.turbo_recharge, next.turbo_recharge);
    changed |= diff_field(patch.turbo_duration_left, previous.turbo_duration_left, next.turbo_duration_left);
    changed |= diff_field(patch.missile_charges, previous.missile_charges, next.missile_charges);
    changed |= diff_field(patch.missile_recharge, previous.missile_recharge, next.missile_recharge);
    changed |= diff_field(patch.impact_spin_time_left, previous.impact_spin_time_left, next.impact_spin_time_left);
    if (!changed) return std::nullopt;
    return patch;
}

std::optional<MissilePatch> diff_missile(const MissileState& previous, const MissileState& next) {
    MissilePatch patch;
    patch.id = next.id;
    bool changed = false;
    changed |= diff_field(patch.owner_id, previous.owner_id, next.owner_id);
    changed |= diff_field(patch.x, previous.x, next.x);
    changed |= diff_field(patch.z, previous.z, next.z);
    changed |= diff_field(patch.angle, previous.angle, next.angle);
    changed |= diff_field(patch.speed, previous.speed, next.speed);
    changed |= diff_field(patch.target_id, previous.target_id, next.target_id);
    if (!changed) return std::nullopt;
    return patch;
}

template<typename T>
std::unordered_map<std::string, const T*> index_by_key(const std::vector<T>& values) {
    std::unordered_map<std::string, const T*> index;
    index.reserve(values.size());
    for (const auto& value : values) {
        index[entity_key(value)] = &value;
    }
    return index;
}

template<typename State, typename Patch, typename DiffFn>
std::optional<EntityDelta<State, Patch>> diff_entities(const std::vector<State>& previous,
                                                       const std::vector<State>& next,
                                                       DiffFn diff) {
    auto prev_index = index_by_key(previous);
    auto next_index = index_by_key(next);

    EntityDelta<State, Patch> delta;
    for (const auto& value : next) {
        auto it = prev_index.find(entity_key(value));
        if (it == prev_index.end()) {
            delta.added.push_back(value);
        } else if (auto patch = diff(*it->second, value)) {
            delta.updated.push_back(std::move(*patch));
        }
    }
    for (const auto& value : previous) {
        if (!next_index.count(entity_key(value))) {
            delta.removed.push_back(entity_key(value));
        }
    }

    if (delta.empty()) return std::nullopt;
    return delta;
}

// Items are never patched: a changed item is sent as remove + add
std::optional<ItemDelta> diff_items(const std::vector<ItemState>& previous,
                                    const std::vector<ItemState>& next) {
    auto prev_index = index_by_key(previous);
    auto next_index = index_by_key(next);

    ItemDelta delta;
    for (const auto& item : next) {
        auto it = prev_index.find(item.id);
        if (it == prev_index.end()) {
            delta.added.push_back(item);
        } else if (!(*it->second == item)) {
            delta.removed.push_back(item.id);
            delta.added.push_back(item);
        }
    }
    for (const auto& item : previous) {
        if (!next_index.count(item.id)) {
            delta.removed.push_back(item.id);
        }
    }

    if (delta.empty()) return std::nullopt;
    return delta;
}

} // namespace

std::optional<RoomStateDelta> compute_state_delta(const RoomState& previous, const RoomState& next) {
    RoomStateDelta delta;
    bool changed = false;

    delta.cars = diff_entities<CarState, CarPatch>(previous.cars, next.cars, diff_car);
    delta.missiles = diff_entities<MissileState, MissilePatch>(previous.missiles, next.missiles, diff_missile);
    delta.items = diff_items(previous.items, next.items);
    changed = delta.cars || delta.missiles || delta.items;

    changed |= diff_field(delta.track_id, previous.track_id, next.track_id);
    changed |= diff_field(delta.server_time, previous.server_time, next.server_time);
    changed |= diff_field(delta.radio, previous.radio, next.radio);
    changed |= diff_field(delta.race, previous.race, next.race);

    if (!changed && previous.room_id == next.room_id) {
        return std::nullopt;
    }

    // Receivers key logs and resync requests off the room id
    delta.room_id = next.room_id;
    return delta;
}

bool has_broadcastable_changes(const RoomStateDelta& delta) {
    return delta.cars || delta.missiles || delta.items || delta.race || delta.radio ||
           delta.track_id;
}

size_t count_changes(const RoomStateDelta& delta) {
    size_t count = 0;
    if (delta.cars) count += delta.cars->change_count();
    if (delta.missiles) count += delta.missiles->change_count();
    if (delta.items) count += delta.items->change_count();
    if (delta.race) count += 1;
    if (delta.radio) count += 1;
    return count;
}

bool should_send_full_snapshot(const RoomStateDelta& delta,
                               const RoomState& previous,
                               const RoomState& next,
                               const DeltaThresholds& thresholds) {
    const size_t changed = count_changes(delta);
    const size_t total = std::max({
        previous.cars.size() + previous.missiles.size() + previous.items.size(),
        next.cars.size() + next.missiles.size() + next.items.size(),
        size_t{1},
    });
    const double ratio = static_cast<double>(changed) / static_cast<double>(total);

    if (ratio >= thresholds.max_ratio) {
        return true;
    }
    return changed >= thresholds.min_changes;
}

} // namespace racesync::server
