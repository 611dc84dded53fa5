#pragma once

#include "protocol/messages.hpp"
#include "protocol/room_state.hpp"
#include "server/game_config.hpp"
#include "server/spatial_hash.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace racesync::server {

using ConnectionId = uint32_t;

constexpr size_t MAX_USERNAME_LENGTH = 20;

// One race room: the authoritative RoomState plus the connections bound to it.
// Vehicle motion is integrated elsewhere and written in through set_car_pose();
// update() runs the rules that depend on proximity (item pickups, missile
// targeting and hits) through a SpatialHash rebuilt every tick.
// Not thread-safe: all access must occur on the game loop thread.
class Room {
public:
    Room(std::string room_id, const GameConfig& config);

    const std::string& room_id() const { return room_id_; }
    const protocol::TrackData& track() const { return config_.track(); }

    // Connections
    void add_viewer(ConnectionId connection, const std::string& player_id);
    std::optional<std::string> remove_viewer(ConnectionId connection);
    bool has_viewer_for_player(const std::string& player_id) const;
    bool is_player_id_taken(const std::string& player_id) const;
    void attach_controller(ConnectionId connection, const std::string& player_id);
    std::optional<std::string> detach_controller(ConnectionId connection);
    std::optional<ConnectionId> controller_for(const std::string& player_id) const;
    std::vector<ConnectionId> connections() const;
    bool is_empty() const { return viewers_.empty() && controllers_.empty(); }

    // Players
    const protocol::CarState& add_player(const std::string& player_id);
    // Returns the controller connection that was bound to the player, if any
    std::optional<ConnectionId> remove_player(const std::string& player_id);
    bool has_car(const std::string& player_id) const;
    int human_player_count() const;
    std::vector<protocol::PlayerSummary> players() const;
    std::string username_for(const std::string& player_id) const;
    // Throws std::runtime_error for unknown players or blank names
    std::string update_username(const std::string& player_id, const std::string& username);

    // Input
    void apply_input(const std::string& player_id, const protocol::InputMsg& input);
    const protocol::InputMsg* latest_input(const std::string& player_id) const;

    // Pose written by the external vehicle simulation
    bool set_car_pose(const std::string& player_id, double x, double z, double angle, double speed);

    void cycle_radio();
    const protocol::RadioState& radio() const { return radio_; }

    void update(double dt);

    protocol::RoomState state() const;
    double server_time() const { return server_time_; }
    const std::vector<protocol::CarState>& cars() const { return cars_; }
    std::vector<protocol::MissileState> missiles() const;
    std::vector<protocol::ItemState> active_items() const;

    // Broad-phase over the car index rebuilt by update()
    void cars_near(double x, double z, double radius, std::vector<uint32_t>& out) const;

private:
    struct SpawnPoint {
        double x = 0.0;
        double z = 0.0;
        double angle = 0.0;
    };

    struct CarRuntime {
        SpawnPoint spawn;
        protocol::InputMsg input;
        double turbo_active_time = 0.0;
        double turbo_recharge_progress = 0.0;
        double missile_recharge_progress = 0.0;
        double spin_angular_velocity = 0.0;
    };

    struct MissileRuntime {
        protocol::MissileState state;
        double distance_travelled = 0.0;
    };

    struct ItemSlot {
        protocol::ItemState state;
        bool active = true;
        double respawn_timer = 0.0;
    };

    protocol::CarState* find_car(const std::string& player_id);
    const protocol::CarState* find_car(const std::string& player_id) const;
    SpawnPoint grid_slot(size_t slot) const;

    void reset_car(protocol::CarState& car, CarRuntime& runtime);
    void activate_turbo(protocol::CarState& car, CarRuntime& runtime);
    void fire_missile(protocol::CarState& car);

    void update_turbo(double dt);
    void update_missile_charges(double dt);
    void update_spin(double dt);
    void update_item_respawns(double dt);
    void rebuild_car_index();
    void resolve_item_pickups();
    void update_missiles(double dt);
    std::string acquire_target(const protocol::MissileState& missile) const;
    void apply_missile_impact(protocol::CarState& car);

    std::string room_id_;
    const GameConfig& config_;

    double server_time_ = 0.0;
    std::vector<protocol::CarState> cars_;
    std::unordered_map<std::string, CarRuntime> runtime_;
    std::vector<MissileRuntime> missiles_;
    std::vector<ItemSlot> items_;
    protocol::RadioState radio_;
    uint32_t missile_sequence_ = 0;

    std::unordered_map<ConnectionId, std::string> viewers_;
    std::unordered_map<ConnectionId, std::string> controllers_;

    SpatialHash car_index_;
    mutable std::vector<uint32_t> query_scratch_;
};

} // namespace racesync::server
