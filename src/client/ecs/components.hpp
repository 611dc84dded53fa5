#pragma once

#include "client/motion_smoothing.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <string>

namespace racesync::client::ecs {

enum class EntityKind : uint8_t {
    Car,
    Missile,
    Item,
};

// Server identity: playerId for cars, id for missiles and items
struct NetworkKey {
    EntityKind kind = EntityKind::Car;
    std::string id;
};

// Coordinate system: Y-up. x,z form the horizontal ground plane
struct RenderTransform {
    glm::dvec3 position{0.0};
    glm::dquat rotation{1.0, 0.0, 0.0, 0.0};
    double yaw = 0.0;
};

struct CarMotion {
    CarSmoother smoother;
};

struct MissileMotion {
    MissileSmoother smoother;
};

struct ItemMotion {
    ItemAnimator animator;
    protocol::ItemType type = protocol::ItemType::Nitro;
};

struct Name {
    std::string value;
};

struct Owner {
    std::string player_id;
};

struct Turbo {
    bool active = false;
    int charges = 0;
};

struct LocalPlayer {};

} // namespace racesync::client::ecs
