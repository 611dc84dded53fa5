#pragma once

#include "client/ecs/components.hpp"
#include "client/motion_smoothing.hpp"
#include "protocol/room_state.hpp"
#include <entt/entt.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace racesync::client {

/**
 * Mirrors the latest RoomState into the registry.
 *
 * One entity per car, missile and item id: created with its smoother the
 * first time the id appears, retargeted on every later snapshot, destroyed
 * once the id is missing from a snapshot.
 */
class EntitySyncSystem {
public:
    explicit EntitySyncSystem(const SmoothingConfig& config) : config_(config) {}

    void sync(entt::registry& registry, const protocol::RoomState& state,
              const std::string& local_player_id);

    // Destroy every entity this system created
    void clear(entt::registry& registry);

    entt::entity find(ecs::EntityKind kind, const std::string& id) const;
    size_t entity_count() const { return cars_.size() + missiles_.size() + items_.size(); }

private:
    using EntityMap = std::unordered_map<std::string, entt::entity>;

    entt::entity create(entt::registry& registry, EntityMap& map, ecs::EntityKind kind, const std::string& id);
    void destroy_missing(entt::registry& registry, EntityMap& map, const std::unordered_set<std::string>& seen);

    SmoothingConfig config_;
    EntityMap cars_;
    EntityMap missiles_;
    EntityMap items_;
};

} // namespace racesync::client
