#include "game_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace racesync::server {

using namespace racesync::protocol;

bool GameConfig::load(const std::string& data_dir) {
    bool ok = true;
    ok = load_server(data_dir + "/server.json") && ok;
    ok = load_network(data_dir + "/network.json") && ok;
    ok = load_gameplay(data_dir + "/gameplay.json") && ok;
    ok = load_track(data_dir + "/track.json") && ok;
    return ok;
}

bool GameConfig::load_server(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        server_.tick_rate = j.value("tick_rate", 60.0f);
        server_.broadcast_rate = j.value("broadcast_rate", 20.0f);
        server_.default_port = j.value("default_port", 4000);
        server_.max_players_per_room = j.value("max_players_per_room", 8);
        server_.protocol_version = j.value("protocol_version", 1);
        server_.server_version = j.value("server_version", "0.1.0");
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::load_network(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        network_.spatial_hash_cell_size = j.value("spatial_hash_cell_size", 10.0);
        network_.delta_max_ratio = j.value("delta_max_ratio", 0.6);
        network_.delta_min_changes = j.value("delta_min_changes", 64);
        network_.number_precision = j.value("number_precision", 3);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::load_gameplay(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        gameplay_.item_pickup_radius = j.value("item_pickup_radius", 2.5);
        gameplay_.missile_acquisition_radius = j.value("missile_acquisition_radius", 60.0);
        gameplay_.max_turbo_charges = j.value("max_turbo_charges", 3);
        gameplay_.max_missile_charges = j.value("max_missile_charges", 3);
        gameplay_.item_respawn_time = j.value("item_respawn_time", 8.0);
        gameplay_.grid_row_spacing = j.value("grid_row_spacing", 6.0);
        gameplay_.grid_lane_offset = j.value("grid_lane_offset", 2.5);
        gameplay_.turbo_duration = j.value("turbo_duration", 1.5);
        gameplay_.turbo_recharge_seconds = j.value("turbo_recharge_seconds", 6.0);
        gameplay_.missile_recharge_seconds = j.value("missile_recharge_seconds", 8.0);
        gameplay_.missile_min_speed = j.value("missile_min_speed", 45.0);
        gameplay_.missile_speed_multiplier = j.value("missile_speed_multiplier", 1.6);
        gameplay_.missile_hit_radius = j.value("missile_hit_radius", 1.6);
        gameplay_.missile_max_range = j.value("missile_max_range", 400.0);
        gameplay_.impact_spin_duration = j.value("impact_spin_duration", 1.2);
        gameplay_.impact_spin_turns = j.value("impact_spin_turns", 2.0);
        gameplay_.radio_station_count = j.value("radio_station_count", 5);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool GameConfig::load_track(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[GameConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        track_ = j.get<TrackData>();
        if (track_.id.empty()) {
            track_.id = "track-default";
        }

        item_spawns_.clear();
        if (j.contains("items")) {
            for (const auto& it : j["items"]) {
                ItemSpawnConfig spawn;
                spawn.type = item_type_from_string(it.value("type", "nitro"));
                spawn.x = it.value("x", 0.0);
                spawn.z = it.value("z", 0.0);
                item_spawns_.push_back(spawn);
            }
        }
        std::cout << "[GameConfig] Loaded track '" << track_.id << "' with "
                  << track_.centerline.size() << " centerline points, "
                  << item_spawns_.size() << " item spawns" << std::endl;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace racesync::server
