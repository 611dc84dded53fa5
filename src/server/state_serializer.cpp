#include "state_serializer.hpp"
#include <cmath>

namespace racesync::server {

using namespace protocol;

double round_number(double value, int precision) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    if (precision <= 0) {
        return value;
    }
    const double factor = std::pow(10.0, precision);
    return std::floor(value * factor + 0.5) / factor;
}

namespace {

void round_optional(std::optional<double>& value, int precision) {
    if (value) {
        *value = round_number(*value, precision);
    }
}

} // namespace

RoomState serialize_room_state(const RoomState& state, int precision) {
    RoomState out = state;
    out.server_time = round_number(state.server_time, precision);

    for (auto& car : out.cars) {
        car.x = round_number(car.x, precision);
        car.z = round_number(car.z, precision);
        car.angle = round_number(car.angle, precision);
        car.speed = round_number(car.speed, precision);
        car.turbo_recharge = round_number(car.turbo_recharge, precision);
        car.turbo_duration_left = round_number(car.turbo_duration_left, precision);
        car.missile_recharge = round_number(car.missile_recharge, precision);
        car.impact_spin_time_left = round_number(car.impact_spin_time_left, precision);
    }

    for (auto& missile : out.missiles) {
        missile.x = round_number(missile.x, precision);
        missile.z = round_number(missile.z, precision);
        missile.angle = round_number(missile.angle, precision);
        missile.speed = round_number(missile.speed, precision);
    }

    for (auto& item : out.items) {
        item.x = round_number(item.x, precision);
        item.z = round_number(item.z, precision);
        item.angle = round_number(item.angle, precision);
    }

    auto& race = out.race;
    round_optional(race.countdown_remaining, precision);
    round_optional(race.countdown_total, precision);
    round_optional(race.finish_timeout_remaining, precision);
    round_optional(race.post_race_remaining, precision);
    for (auto& entry : race.leaderboard) {
        entry.total_distance = round_number(entry.total_distance, precision);
        round_optional(entry.gap_to_first, precision);
        round_optional(entry.finish_time, precision);
    }
    for (auto& player : race.players) {
        player.progress_on_lap = round_number(player.progress_on_lap, precision);
        player.total_distance = round_number(player.total_distance, precision);
        round_optional(player.finish_time, precision);
    }

    return out;
}

} // namespace racesync::server
