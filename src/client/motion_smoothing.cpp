#include "motion_smoothing.hpp"
#include <algorithm>
#include <cmath>

namespace racesync::client {

using namespace racesync::protocol;

namespace {

constexpr double MIN_DISPLACEMENT_SQ = 1e-4;
constexpr double DEGENERATE_FORWARD_SQ = 1e-12;

} // anonymous namespace

double smoothing_alpha(double rate, double dt) {
    if (!(dt > 0.0) || !(rate > 0.0)) return 0.0;
    return 1.0 - std::exp(-rate * dt);
}

double smoothstep01(double t) {
    t = std::clamp(t, 0.0, 1.0);
    return t * t * (3.0 - 2.0 * t);
}

double shortest_angle_delta(double from, double to) {
    const double two_pi = glm::two_pi<double>();
    double delta = std::fmod(to - from, two_pi);
    if (delta > glm::pi<double>()) delta -= two_pi;
    if (delta <= -glm::pi<double>()) delta += two_pi;
    return delta;
}

glm::dvec2 heading_direction(double angle) {
    return glm::dvec2(std::cos(angle), std::sin(angle));
}

double heading_blend_weight(double speed, double blend_speed, double displacement_length_sq) {
    if (displacement_length_sq < MIN_DISPLACEMENT_SQ || !(blend_speed > 0.0)) {
        return 0.0;
    }
    return smoothstep01(std::abs(speed) / blend_speed);
}

double blended_yaw(double angle, double speed, const glm::dvec2& displacement, double blend_speed) {
    const glm::dvec2 heading = heading_direction(angle);
    const double length_sq = glm::dot(displacement, displacement);
    const double w = heading_blend_weight(speed, blend_speed, length_sq);

    glm::dvec2 forward = heading;
    if (w > 0.0) {
        forward = (1.0 - w) * heading + w * (displacement / std::sqrt(length_sq));
        if (glm::dot(forward, forward) < DEGENERATE_FORWARD_SQ) {
            forward = heading;
        }
    }
    // dvec2 stores (x, z)
    return std::atan2(forward.x, forward.y);
}

glm::dquat yaw_pitch_rotation(double yaw, double pitch) {
    glm::dquat yaw_q = glm::angleAxis(yaw, glm::dvec3(0.0, 1.0, 0.0));
    // Positive pitch raises the nose (+z)
    glm::dquat pitch_q = glm::angleAxis(-pitch, glm::dvec3(1.0, 0.0, 0.0));
    return yaw_q * pitch_q;
}

glm::dvec3 pivot_corrected_origin(const glm::dvec3& position, double yaw, double pitch,
                                  double rear_axle_offset) {
    const glm::dvec3 pivot(0.0, 0.0, -rear_axle_offset);
    glm::dquat yaw_q = glm::angleAxis(yaw, glm::dvec3(0.0, 1.0, 0.0));
    glm::dquat full_q = yaw_pitch_rotation(yaw, pitch);
    return position + yaw_q * pivot - full_q * pivot;
}

// ============================================================================
// PositionSmoother / YawSmoother
// ============================================================================

void PositionSmoother::set_target(const glm::dvec2& target) {
    target_ = target;
    if (!initialized_) {
        position_ = target;
        initialized_ = true;
    }
}

void PositionSmoother::snap_to(const glm::dvec2& position) {
    position_ = position;
    target_ = position;
    initialized_ = true;
}

void PositionSmoother::update(double dt) {
    if (!initialized_) return;
    position_ += (target_ - position_) * smoothing_alpha(rate_, dt);
}

void YawSmoother::set_target(double yaw) {
    target_ = yaw;
    if (!initialized_) {
        yaw_ = yaw;
        initialized_ = true;
    }
}

void YawSmoother::update(double dt) {
    if (!initialized_) return;
    yaw_ += shortest_angle_delta(yaw_, target_) * smoothing_alpha(rate_, dt);
    // Keep the accumulated angle bounded
    yaw_ = std::remainder(yaw_, glm::two_pi<double>());
}

// ============================================================================
// TurboLift
// ============================================================================

void TurboLift::update(bool turbo_active, double speed, double dt) {
    if (!(dt > 0.0)) return;
    const double target = (turbo_active && speed > config_.turbo_lift_speed_threshold)
        ? config_.turbo_lift_angle : 0.0;

    if (angle_ < target) {
        angle_ = std::min(target, angle_ + config_.turbo_lift_rise_rate * dt);
    } else if (angle_ > target) {
        angle_ = std::max(target, angle_ - config_.turbo_lift_fall_rate * dt);
    }
}

// ============================================================================
// CarSmoother
// ============================================================================

CarSmoother::CarSmoother(const SmoothingConfig& config)
    : config_(config)
    , position_(config.car_position_rate)
    , yaw_(config.car_rotation_rate)
    , lift_(config) {
}

void CarSmoother::set_target(const CarState& car) {
    const glm::dvec2 target(car.x, car.z);
    if (!position_.initialized()) {
        last_target_ = target;
    }
    const glm::dvec2 displacement = target - last_target_;
    last_target_ = target;

    position_.set_target(target);
    yaw_.set_target(blended_yaw(car.angle, car.speed, displacement, config_.heading_blend_speed));
    turbo_active_ = car.turbo_active;
    speed_ = car.speed;
}

void CarSmoother::update(double dt) {
    position_.update(dt);
    yaw_.update(dt);
    lift_.update(turbo_active_, speed_, dt);
}

glm::dvec3 CarSmoother::render_position() const {
    const glm::dvec2& p = position_.position();
    return pivot_corrected_origin(glm::dvec3(p.x, 0.0, p.y), yaw_.yaw(), lift_.angle(),
                                  config_.rear_axle_offset);
}

glm::dquat CarSmoother::orientation() const {
    return yaw_pitch_rotation(yaw_.yaw(), lift_.angle());
}

// ============================================================================
// MissileSmoother
// ============================================================================

MissileSmoother::MissileSmoother(const SmoothingConfig& config)
    : position_(config.missile_position_rate)
    , yaw_(config.missile_rotation_rate) {
}

void MissileSmoother::set_target(const MissileState& missile) {
    position_.set_target(glm::dvec2(missile.x, missile.z));
    const glm::dvec2 forward = heading_direction(missile.angle);
    yaw_.set_target(std::atan2(forward.x, forward.y));
}

void MissileSmoother::update(double dt) {
    position_.update(dt);
    yaw_.update(dt);
}

glm::dvec3 MissileSmoother::render_position() const {
    const glm::dvec2& p = position_.position();
    return glm::dvec3(p.x, 0.0, p.y);
}

// ============================================================================
// ItemAnimator
// ============================================================================

void ItemAnimator::set_state(const ItemState& item) {
    position_ = glm::dvec2(item.x, item.z);
    base_angle_ = item.angle;
}

void ItemAnimator::update(double dt) {
    if (!(dt > 0.0)) return;
    phase_ = std::fmod(phase_ + dt * config_.item_float_speed, glm::two_pi<double>());
    spin_ = std::fmod(spin_ + dt * config_.item_spin_speed, glm::two_pi<double>());
}

double ItemAnimator::bob_offset() const {
    return std::sin(phase_) * config_.item_float_amplitude;
}

glm::dvec3 ItemAnimator::render_position() const {
    return glm::dvec3(position_.x, bob_offset(), position_.y);
}

} // namespace racesync::client
