#pragma once

#include "protocol/room_state.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

namespace racesync::client {

struct SmoothingConfig {
    // Exponential approach rates (1/s)
    double car_position_rate = 7.0;
    double car_rotation_rate = 8.0;
    double missile_position_rate = 12.0;
    double missile_rotation_rate = 16.0;

    // Speed at which the rendered heading fully follows the direction of travel
    double heading_blend_speed = 10.0;

    // Nose lift while the turbo is burning, pivoting about the rear axle
    double turbo_lift_angle = 0.12;
    double turbo_lift_rise_rate = 0.9;
    double turbo_lift_fall_rate = 0.45;
    double turbo_lift_speed_threshold = 5.0;
    double rear_axle_offset = 1.5;

    double item_float_amplitude = 0.35;
    double item_float_speed = 1.5;
    double item_spin_speed = glm::pi<double>();
};

// Fraction of the remaining distance to cover this frame: 1 - exp(-rate * dt)
double smoothing_alpha(double rate, double dt);

// t^2 (3 - 2t) on [0, 1]
double smoothstep01(double t);

// Signed shortest rotation from one angle to another, in (-pi, pi]
double shortest_angle_delta(double from, double to);

// Unit vector on the (x, z) plane for a heading angle
glm::dvec2 heading_direction(double angle);

// Weight given to the displacement direction over the raw heading
double heading_blend_weight(double speed, double blend_speed, double displacement_length_sq);

// Render yaw for a car: atan2 of the blended forward vector (x over z)
double blended_yaw(double angle, double speed, const glm::dvec2& displacement, double blend_speed);

// Origin that keeps the rear axle planted while the body pitches:
// position + R_yaw * p - R_full * p with p = (0, 0, -rear_axle_offset)
glm::dvec3 pivot_corrected_origin(const glm::dvec3& position, double yaw, double pitch,
                                  double rear_axle_offset);

glm::dquat yaw_pitch_rotation(double yaw, double pitch);

class PositionSmoother {
public:
    explicit PositionSmoother(double rate) : rate_(rate) {}

    // The first target snaps
    void set_target(const glm::dvec2& target);
    void snap_to(const glm::dvec2& position);
    void update(double dt);

    bool initialized() const { return initialized_; }
    const glm::dvec2& position() const { return position_; }
    const glm::dvec2& target() const { return target_; }

private:
    double rate_;
    bool initialized_ = false;
    glm::dvec2 position_{0.0};
    glm::dvec2 target_{0.0};
};

class YawSmoother {
public:
    explicit YawSmoother(double rate) : rate_(rate) {}

    void set_target(double yaw);
    void update(double dt);

    double yaw() const { return yaw_; }
    double target() const { return target_; }

private:
    double rate_;
    bool initialized_ = false;
    double yaw_ = 0.0;
    double target_ = 0.0;
};

// Linear approach toward the lift target, faster up than down
class TurboLift {
public:
    explicit TurboLift(const SmoothingConfig& config) : config_(config) {}

    void update(bool turbo_active, double speed, double dt);
    double angle() const { return angle_; }

private:
    SmoothingConfig config_;
    double angle_ = 0.0;
};

class CarSmoother {
public:
    explicit CarSmoother(const SmoothingConfig& config);

    void set_target(const protocol::CarState& car);
    void update(double dt);

    // Pivot-corrected for the current lift
    glm::dvec3 render_position() const;
    glm::dquat orientation() const;
    double yaw() const { return yaw_.yaw(); }
    double lift() const { return lift_.angle(); }
    const PositionSmoother& position_smoother() const { return position_; }

private:
    SmoothingConfig config_;
    PositionSmoother position_;
    YawSmoother yaw_;
    TurboLift lift_;
    glm::dvec2 last_target_{0.0};
    bool turbo_active_ = false;
    double speed_ = 0.0;
};

class MissileSmoother {
public:
    explicit MissileSmoother(const SmoothingConfig& config);

    void set_target(const protocol::MissileState& missile);
    void update(double dt);

    glm::dvec3 render_position() const;
    double yaw() const { return yaw_.yaw(); }

private:
    PositionSmoother position_;
    YawSmoother yaw_;
};

class ItemAnimator {
public:
    explicit ItemAnimator(const SmoothingConfig& config) : config_(config) {}

    void set_state(const protocol::ItemState& item);
    void update(double dt);

    glm::dvec3 render_position() const;
    double bob_offset() const;
    double yaw() const { return base_angle_ + spin_; }

private:
    SmoothingConfig config_;
    glm::dvec2 position_{0.0};
    double base_angle_ = 0.0;
    double phase_ = 0.0;
    double spin_ = 0.0;
};

} // namespace racesync::client
