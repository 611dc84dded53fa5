#include "motion_system.hpp"
#include "client/ecs/components.hpp"

namespace racesync::client {

void MotionSystem::update(entt::registry& registry, double dt) {
    auto cars = registry.view<ecs::CarMotion, ecs::RenderTransform>();
    for (auto entity : cars) {
        auto& motion = cars.get<ecs::CarMotion>(entity);
        auto& transform = cars.get<ecs::RenderTransform>(entity);
        motion.smoother.update(dt);
        transform.position = motion.smoother.render_position();
        transform.rotation = motion.smoother.orientation();
        transform.yaw = motion.smoother.yaw();
    }

    auto missiles = registry.view<ecs::MissileMotion, ecs::RenderTransform>();
    for (auto entity : missiles) {
        auto& motion = missiles.get<ecs::MissileMotion>(entity);
        auto& transform = missiles.get<ecs::RenderTransform>(entity);
        motion.smoother.update(dt);
        transform.position = motion.smoother.render_position();
        transform.yaw = motion.smoother.yaw();
        transform.rotation = yaw_pitch_rotation(transform.yaw, 0.0);
    }

    auto items = registry.view<ecs::ItemMotion, ecs::RenderTransform>();
    for (auto entity : items) {
        auto& motion = items.get<ecs::ItemMotion>(entity);
        auto& transform = items.get<ecs::RenderTransform>(entity);
        motion.animator.update(dt);
        transform.position = motion.animator.render_position();
        transform.yaw = motion.animator.yaw();
        transform.rotation = yaw_pitch_rotation(transform.yaw, 0.0);
    }
}

} // namespace racesync::client
