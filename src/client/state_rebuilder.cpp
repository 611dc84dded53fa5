#include "state_rebuilder.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace racesync::client {

using namespace protocol;

namespace {

template<typename T>
class KeyedList {
public:
    explicit KeyedList(const std::vector<T>& base) {
        values_.reserve(base.size());
        for (const auto& value : base) {
            upsert(value);
        }
    }

    void remove(const std::vector<std::string>& ids) {
        if (ids.empty()) return;
        std::unordered_set<std::string> doomed(ids.begin(), ids.end());
        std::vector<T> kept;
        kept.reserve(values_.size());
        for (auto& value : values_) {
            if (!doomed.count(entity_key(value))) {
                kept.push_back(std::move(value));
            }
        }
        values_ = std::move(kept);
        reindex();
    }

    T* find(const std::string& id) {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &values_[it->second];
    }

    void upsert(const T& value) {
        if (T* existing = find(entity_key(value))) {
            *existing = value;
            return;
        }
        index_.emplace(entity_key(value), values_.size());
        values_.push_back(value);
    }

    std::vector<T> take() { return std::move(values_); }

private:
    void reindex() {
        index_.clear();
        for (size_t i = 0; i < values_.size(); ++i) {
            index_.emplace(entity_key(values_[i]), i);
        }
    }

    std::vector<T> values_;
    std::unordered_map<std::string, size_t> index_;
};

template<typename State, typename Patch>
std::vector<State> merge_entities(const std::vector<State>& base,
                                  const EntityDelta<State, Patch>& delta) {
    KeyedList<State> list(base);
    list.remove(delta.removed);

    for (const auto& patch : delta.updated) {
        if (State* existing = list.find(entity_key(patch))) {
            apply_patch(*existing, patch);
        } else {
            list.upsert(materialize(patch));
        }
    }
    for (const auto& added : delta.added) {
        list.upsert(added);
    }
    return list.take();
}

std::vector<ItemState> merge_items(const std::vector<ItemState>& base, const ItemDelta& delta) {
    KeyedList<ItemState> list(base);
    list.remove(delta.removed);
    for (const auto& added : delta.added) {
        list.upsert(added);
    }
    return list.take();
}

} // namespace

std::optional<RoomState> apply_room_state_delta(const RoomState* base, const RoomStateDelta& delta) {
    if (!base) {
        return std::nullopt;
    }

    RoomState next = *base;
    merge_field(next.room_id, delta.room_id);
    merge_field(next.track_id, delta.track_id);
    merge_field(next.server_time, delta.server_time);

    if (delta.cars) {
        next.cars = merge_entities(base->cars, *delta.cars);
    }
    if (delta.missiles) {
        next.missiles = merge_entities(base->missiles, *delta.missiles);
    }
    if (delta.items) {
        next.items = merge_items(base->items, *delta.items);
    }

    merge_field(next.radio, delta.radio);
    merge_field(next.race, delta.race);
    return next;
}

} // namespace racesync::client
