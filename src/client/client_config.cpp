#include "client_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace racesync::client {

bool ClientConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ClientConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        host = j.value("host", host);
        port = j.value("port", port);
        role = protocol::player_role_from_string(j.value("role", std::string(protocol::to_string(role))))
                   .value_or(protocol::PlayerRole::Viewer);
        room_id = j.value("room_id", room_id);
        player_id = j.value("player_id", player_id);
        session_token = j.value("session_token", session_token);
        username = j.value("username", username);
        frame_rate = j.value("frame_rate", frame_rate);
        status_interval = j.value("status_interval", status_interval);

        if (j.contains("smoothing")) {
            const auto& s = j["smoothing"];
            smoothing.car_position_rate = s.value("car_position_rate", smoothing.car_position_rate);
            smoothing.car_rotation_rate = s.value("car_rotation_rate", smoothing.car_rotation_rate);
            smoothing.missile_position_rate = s.value("missile_position_rate", smoothing.missile_position_rate);
            smoothing.missile_rotation_rate = s.value("missile_rotation_rate", smoothing.missile_rotation_rate);
            smoothing.heading_blend_speed = s.value("heading_blend_speed", smoothing.heading_blend_speed);
            smoothing.turbo_lift_angle = s.value("turbo_lift_angle", smoothing.turbo_lift_angle);
            smoothing.turbo_lift_rise_rate = s.value("turbo_lift_rise_rate", smoothing.turbo_lift_rise_rate);
            smoothing.turbo_lift_fall_rate = s.value("turbo_lift_fall_rate", smoothing.turbo_lift_fall_rate);
            smoothing.turbo_lift_speed_threshold = s.value("turbo_lift_speed_threshold", smoothing.turbo_lift_speed_threshold);
            smoothing.rear_axle_offset = s.value("rear_axle_offset", smoothing.rear_axle_offset);
            smoothing.item_float_amplitude = s.value("item_float_amplitude", smoothing.item_float_amplitude);
            smoothing.item_float_speed = s.value("item_float_speed", smoothing.item_float_speed);
            smoothing.item_spin_speed = s.value("item_spin_speed", smoothing.item_spin_speed);
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ClientConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace racesync::client
