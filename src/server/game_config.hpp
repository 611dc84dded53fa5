#pragma once

#include "protocol/messages.hpp"
#include "protocol/room_state.hpp"
#include "server/state_diff.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace racesync::server {

struct ServerConfig {
    float tick_rate = 60.0f;
    float broadcast_rate = 20.0f;
    uint16_t default_port = 4000;
    int max_players_per_room = 8;
    int protocol_version = 1;
    std::string server_version = "0.1.0";
};

struct NetworkConfig {
    double spatial_hash_cell_size = 10.0;
    double delta_max_ratio = 0.6;
    int delta_min_changes = 64;
    int number_precision = 3;

    DeltaThresholds delta_thresholds() const {
        return DeltaThresholds{delta_max_ratio, static_cast<size_t>(std::max(delta_min_changes, 0))};
    }
};

struct GameplayConfig {
    double item_pickup_radius = 2.5;
    double missile_acquisition_radius = 60.0;
    int max_turbo_charges = 3;
    int max_missile_charges = 3;
    double item_respawn_time = 8.0;

    // Start grid
    double grid_row_spacing = 6.0;
    double grid_lane_offset = 2.5;

    // Turbo
    double turbo_duration = 1.5;
    double turbo_recharge_seconds = 6.0;

    // Missiles
    double missile_recharge_seconds = 8.0;
    double missile_min_speed = 45.0;
    double missile_speed_multiplier = 1.6;
    double missile_hit_radius = 1.6;
    double missile_max_range = 400.0;
    double impact_spin_duration = 1.2;
    double impact_spin_turns = 2.0;

    int radio_station_count = 5;
};

struct ItemSpawnConfig {
    protocol::ItemType type = protocol::ItemType::Nitro;
    double x = 0.0;
    double z = 0.0;
};

class GameConfig {
public:
    bool load(const std::string& data_dir);

    const ServerConfig& server() const { return server_; }
    const NetworkConfig& network() const { return network_; }
    const GameplayConfig& gameplay() const { return gameplay_; }

    // Track
    const protocol::TrackData& track() const { return track_; }
    const std::vector<ItemSpawnConfig>& item_spawns() const { return item_spawns_; }

    // Mutable access for tests and tools that build a config in code
    ServerConfig& mutable_server() { return server_; }
    NetworkConfig& mutable_network() { return network_; }
    GameplayConfig& mutable_gameplay() { return gameplay_; }
    protocol::TrackData& mutable_track() { return track_; }
    std::vector<ItemSpawnConfig>& mutable_item_spawns() { return item_spawns_; }

private:
    bool load_server(const std::string& path);
    bool load_network(const std::string& path);
    bool load_gameplay(const std::string& path);
    bool load_track(const std::string& path);

    ServerConfig server_;
    NetworkConfig network_;
    GameplayConfig gameplay_;
    protocol::TrackData track_;
    std::vector<ItemSpawnConfig> item_spawns_;
};

} // namespace racesync::server
