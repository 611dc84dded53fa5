#include "entity_sync_system.hpp"
#include <vector>

namespace racesync::client {

using namespace racesync::protocol;

void EntitySyncSystem::sync(entt::registry& registry, const RoomState& state,
                            const std::string& local_player_id) {
    std::unordered_set<std::string> seen;

    for (const auto& car : state.cars) {
        seen.insert(car.player_id);
        entt::entity entity = find(ecs::EntityKind::Car, car.player_id);
        if (entity == entt::null) {
            entity = create(registry, cars_, ecs::EntityKind::Car, car.player_id);
            registry.emplace<ecs::CarMotion>(entity, ecs::CarMotion{CarSmoother(config_)});
            registry.emplace<ecs::Name>(entity);
            registry.emplace<ecs::Turbo>(entity);
        }

        registry.get<ecs::CarMotion>(entity).smoother.set_target(car);
        registry.get<ecs::Name>(entity).value = car.username.empty() ? car.player_id : car.username;
        auto& turbo = registry.get<ecs::Turbo>(entity);
        turbo.active = car.turbo_active;
        turbo.charges = car.turbo_charges;

        bool is_local = !local_player_id.empty() && car.player_id == local_player_id;
        if (is_local && !registry.all_of<ecs::LocalPlayer>(entity)) {
            registry.emplace<ecs::LocalPlayer>(entity);
        } else if (!is_local && registry.all_of<ecs::LocalPlayer>(entity)) {
            registry.remove<ecs::LocalPlayer>(entity);
        }
    }
    destroy_missing(registry, cars_, seen);

    seen.clear();
    for (const auto& missile : state.missiles) {
        seen.insert(missile.id);
        entt::entity entity = find(ecs::EntityKind::Missile, missile.id);
        if (entity == entt::null) {
            entity = create(registry, missiles_, ecs::EntityKind::Missile, missile.id);
            registry.emplace<ecs::MissileMotion>(entity, ecs::MissileMotion{MissileSmoother(config_)});
            registry.emplace<ecs::Owner>(entity, ecs::Owner{missile.owner_id});
        }
        registry.get<ecs::MissileMotion>(entity).smoother.set_target(missile);
    }
    destroy_missing(registry, missiles_, seen);

    seen.clear();
    for (const auto& item : state.items) {
        seen.insert(item.id);
        entt::entity entity = find(ecs::EntityKind::Item, item.id);
        if (entity == entt::null) {
            entity = create(registry, items_, ecs::EntityKind::Item, item.id);
            registry.emplace<ecs::ItemMotion>(entity, ecs::ItemMotion{ItemAnimator(config_), item.type});
        }
        auto& motion = registry.get<ecs::ItemMotion>(entity);
        motion.animator.set_state(item);
        motion.type = item.type;
    }
    destroy_missing(registry, items_, seen);
}

void EntitySyncSystem::clear(entt::registry& registry) {
    for (auto* map : {&cars_, &missiles_, &items_}) {
        for (auto& [id, entity] : *map) {
            if (registry.valid(entity)) {
                registry.destroy(entity);
            }
        }
        map->clear();
    }
}

entt::entity EntitySyncSystem::find(ecs::EntityKind kind, const std::string& id) const {
    const EntityMap* map = &cars_;
    if (kind == ecs::EntityKind::Missile) map = &missiles_;
    if (kind == ecs::EntityKind::Item) map = &items_;
    auto it = map->find(id);
    if (it == map->end()) return entt::null;
    return it->second;
}

entt::entity EntitySyncSystem::create(entt::registry& registry, EntityMap& map,
                                      ecs::EntityKind kind, const std::string& id) {
    entt::entity entity = registry.create();
    registry.emplace<ecs::NetworkKey>(entity, ecs::NetworkKey{kind, id});
    registry.emplace<ecs::RenderTransform>(entity);
    map[id] = entity;
    return entity;
}

void EntitySyncSystem::destroy_missing(entt::registry& registry, EntityMap& map,
                                       const std::unordered_set<std::string>& seen) {
    std::vector<std::string> gone;
    for (const auto& [id, entity] : map) {
        if (!seen.count(id)) {
            gone.push_back(id);
        }
    }
    for (const auto& id : gone) {
        entt::entity entity = map[id];
        if (registry.valid(entity)) {
            registry.destroy(entity);
        }
        map.erase(id);
    }
}

} // namespace racesync::client
