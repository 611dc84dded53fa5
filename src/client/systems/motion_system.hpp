#pragma once

#include <entt/entt.hpp>

namespace racesync::client {

// Advances every smoother and writes the result to RenderTransform
class MotionSystem {
public:
    void update(entt::registry& registry, double dt);
};

} // namespace racesync::client
