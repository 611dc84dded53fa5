#include "room.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace racesync::server {

using namespace racesync::protocol;

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double TAU = PI * 2.0;

double normalize_angle(double angle) {
    double wrapped = std::fmod(angle + PI, TAU);
    if (wrapped < 0.0) wrapped += TAU;
    return wrapped - PI;
}

double clamp_input(double value, double lo, double hi) {
    if (!std::isfinite(value)) return 0.0;
    return std::clamp(value, lo, hi);
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Cut to at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t n = max_bytes;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
    return s.substr(0, n);
}

} // namespace

Room::Room(std::string room_id, const GameConfig& config)
    : room_id_(std::move(room_id))
    , config_(config)
    , car_index_(config.network().spatial_hash_cell_size) {
    uint32_t next_item = 0;
    for (const auto& spawn : config_.item_spawns()) {
        ItemSlot slot;
        slot.state.id = "item-" + std::to_string(next_item++);
        slot.state.type = spawn.type;
        slot.state.x = spawn.x;
        slot.state.z = spawn.z;
        items_.push_back(std::move(slot));
    }
    radio_.enabled = false;
    radio_.station_index = 0;
}

// ============================================================================
// Connections
// ============================================================================

void Room::add_viewer(ConnectionId connection, const std::string& player_id) {
    viewers_[connection] = player_id;
}

std::optional<std::string> Room::remove_viewer(ConnectionId connection) {
    auto it = viewers_.find(connection);
    if (it == viewers_.end()) return std::nullopt;
    std::string player_id = std::move(it->second);
    viewers_.erase(it);
    return player_id;
}

bool Room::has_viewer_for_player(const std::string& player_id) const {
    for (const auto& [connection, viewer_player] : viewers_) {
        if (viewer_player == player_id) return true;
    }
    return false;
}

bool Room::is_player_id_taken(const std::string& player_id) const {
    return has_car(player_id) || has_viewer_for_player(player_id);
}

void Room::attach_controller(ConnectionId connection, const std::string& player_id) {
    controllers_[connection] = player_id;
}

std::optional<std::string> Room::detach_controller(ConnectionId connection) {
    auto it = controllers_.find(connection);
    if (it == controllers_.end()) return std::nullopt;
    std::string player_id = std::move(it->second);
    controllers_.erase(it);
    return player_id;
}

std::optional<ConnectionId> Room::controller_for(const std::string& player_id) const {
    for (const auto& [connection, controller_player] : controllers_) {
        if (controller_player == player_id) return connection;
    }
    return std::nullopt;
}

std::vector<ConnectionId> Room::connections() const {
    std::vector<ConnectionId> out;
    out.reserve(viewers_.size() + controllers_.size());
    for (const auto& [connection, player_id] : viewers_) out.push_back(connection);
    for (const auto& [connection, player_id] : controllers_) out.push_back(connection);
    std::sort(out.begin(), out.end());
    return out;
}

// ============================================================================
// Players
// ============================================================================

Room::SpawnPoint Room::grid_slot(size_t slot) const {
    const auto& centerline = config_.track().centerline;
    SpawnPoint spawn;
    double dir_x = 1.0;
    double dir_z = 0.0;
    if (!centerline.empty()) {
        const auto& start = centerline[0];
        const auto& next = centerline[1 % centerline.size()];
        spawn.x = start.x;
        spawn.z = start.z;
        double dx = next.x - start.x;
        double dz = next.z - start.z;
        double len = std::hypot(dx, dz);
        if (len > 1e-9) {
            dir_x = dx / len;
            dir_z = dz / len;
        }
    }
    spawn.angle = std::atan2(dir_z, dir_x);

    // Two lanes, rows staggered back from the start line
    const auto& gameplay = config_.gameplay();
    double row = static_cast<double>(slot / 2);
    double lane = (slot % 2 == 0) ? -gameplay.grid_lane_offset : gameplay.grid_lane_offset;
    spawn.x += -dir_x * row * gameplay.grid_row_spacing - dir_z * lane;
    spawn.z += -dir_z * row * gameplay.grid_row_spacing + dir_x * lane;
    return spawn;
}

const CarState& Room::add_player(const std::string& player_id) {
    if (CarState* existing = find_car(player_id)) {
        return *existing;
    }

    const auto& gameplay = config_.gameplay();
    CarRuntime runtime;
    runtime.spawn = grid_slot(cars_.size());

    CarState car;
    car.player_id = player_id;
    car.x = runtime.spawn.x;
    car.z = runtime.spawn.z;
    car.angle = runtime.spawn.angle;
    car.turbo_charges = gameplay.max_turbo_charges;
    car.missile_charges = gameplay.max_missile_charges;

    runtime.input.room_id = room_id_;
    runtime.input.player_id = player_id;
    runtime_[player_id] = std::move(runtime);
    cars_.push_back(std::move(car));
    std::cout << "[Room " << room_id_ << "] Player " << player_id << " placed on grid slot "
              << cars_.size() - 1 << std::endl;
    return cars_.back();
}

std::optional<ConnectionId> Room::remove_player(const std::string& player_id) {
    cars_.erase(std::remove_if(cars_.begin(), cars_.end(),
                               [&](const CarState& car) { return car.player_id == player_id; }),
                cars_.end());
    runtime_.erase(player_id);
    missiles_.erase(std::remove_if(missiles_.begin(), missiles_.end(),
                                   [&](const MissileRuntime& m) { return m.state.owner_id == player_id; }),
                    missiles_.end());

    auto controller = controller_for(player_id);
    if (controller) {
        controllers_.erase(*controller);
    }
    return controller;
}

bool Room::has_car(const std::string& player_id) const {
    return find_car(player_id) != nullptr;
}

int Room::human_player_count() const {
    return static_cast<int>(std::count_if(cars_.begin(), cars_.end(),
                                          [](const CarState& car) { return !car.is_npc; }));
}

std::vector<PlayerSummary> Room::players() const {
    std::vector<PlayerSummary> out;
    out.reserve(cars_.size());
    for (const auto& car : cars_) {
        out.push_back(PlayerSummary{car.player_id, username_for(car.player_id), car.is_npc});
    }
    return out;
}

std::string Room::username_for(const std::string& player_id) const {
    const CarState* car = find_car(player_id);
    if (car && !car->username.empty()) {
        return car->username;
    }
    return player_id;
}

std::string Room::update_username(const std::string& player_id, const std::string& username) {
    CarState* car = find_car(player_id);
    if (!car) {
        throw std::runtime_error("Player not found in room");
    }
    std::string normalized = trim(username);
    if (normalized.empty()) {
        throw std::runtime_error("Username cannot be empty");
    }
    if (normalized.size() > MAX_USERNAME_LENGTH) {
        normalized = trim(truncate_utf8(normalized, MAX_USERNAME_LENGTH));
    }
    car->username = normalized;
    return normalized;
}

CarState* Room::find_car(const std::string& player_id) {
    for (auto& car : cars_) {
        if (car.player_id == player_id) return &car;
    }
    return nullptr;
}

const CarState* Room::find_car(const std::string& player_id) const {
    for (const auto& car : cars_) {
        if (car.player_id == player_id) return &car;
    }
    return nullptr;
}

// ============================================================================
// Input and actions
// ============================================================================

void Room::apply_input(const std::string& player_id, const InputMsg& input) {
    CarState* car = find_car(player_id);
    auto it = runtime_.find(player_id);
    if (!car || it == runtime_.end()) {
        return;
    }
    auto& runtime = it->second;
    runtime.input.steer = clamp_input(input.steer, -1.0, 1.0);
    runtime.input.throttle = clamp_input(input.throttle, 0.0, 1.0);
    runtime.input.brake = clamp_input(input.brake, 0.0, 1.0);

    if (!input.actions) {
        return;
    }
    if (input.actions->reset) {
        reset_car(*car, runtime);
    }
    if (input.actions->turbo) {
        activate_turbo(*car, runtime);
    }
    if (input.actions->shoot) {
        fire_missile(*car);
    }
}

const InputMsg* Room::latest_input(const std::string& player_id) const {
    auto it = runtime_.find(player_id);
    return it == runtime_.end() ? nullptr : &it->second.input;
}

void Room::reset_car(CarState& car, CarRuntime& runtime) {
    car.x = runtime.spawn.x;
    car.z = runtime.spawn.z;
    car.angle = runtime.spawn.angle;
    car.speed = 0.0;
    car.impact_spin_time_left = 0.0;
    runtime.spin_angular_velocity = 0.0;
    runtime.input.steer = 0.0;
    runtime.input.throttle = 0.0;
    runtime.input.brake = 0.0;
}

void Room::activate_turbo(CarState& car, CarRuntime& runtime) {
    if (car.turbo_charges <= 0) {
        return;
    }
    car.turbo_charges -= 1;
    runtime.turbo_active_time = std::max(runtime.turbo_active_time, config_.gameplay().turbo_duration);
    car.turbo_active = true;
    car.turbo_duration_left = runtime.turbo_active_time;
}

void Room::fire_missile(CarState& car) {
    if (car.missile_charges <= 0) {
        return;
    }
    const auto& gameplay = config_.gameplay();
    car.missile_charges -= 1;

    MissileRuntime missile;
    missile.state.id = car.player_id + "-m" + std::to_string(missile_sequence_++);
    missile.state.owner_id = car.player_id;
    missile.state.x = car.x;
    missile.state.z = car.z;
    missile.state.angle = car.angle;
    missile.state.speed = std::max(gameplay.missile_min_speed, car.speed * gameplay.missile_speed_multiplier);
    missiles_.push_back(std::move(missile));
}

bool Room::set_car_pose(const std::string& player_id, double x, double z, double angle, double speed) {
    CarState* car = find_car(player_id);
    if (!car || !std::isfinite(x) || !std::isfinite(z) || !std::isfinite(angle) || !std::isfinite(speed)) {
        return false;
    }
    car->x = x;
    car->z = z;
    car->angle = normalize_angle(angle);
    // A spinning car is pinned in place until the spin ends
    car->speed = car->impact_spin_time_left > 0.0 ? 0.0 : speed;
    return true;
}

void Room::cycle_radio() {
    const int stations = std::max(1, config_.gameplay().radio_station_count);
    if (!radio_.enabled) {
        radio_.enabled = true;
        radio_.station_index = 0;
    } else if (radio_.station_index + 1 >= stations) {
        radio_.enabled = false;
        radio_.station_index = 0;
    } else {
        radio_.station_index += 1;
    }
}

// ============================================================================
// Tick
// ============================================================================

void Room::update(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        return;
    }
    update_turbo(dt);
    update_missile_charges(dt);
    update_spin(dt);
    update_item_respawns(dt);
    rebuild_car_index();
    resolve_item_pickups();
    update_missiles(dt);
    server_time_ += dt;
}

void Room::update_turbo(double dt) {
    const auto& gameplay = config_.gameplay();
    for (auto& car : cars_) {
        if (car.is_npc) continue;
        auto& runtime = runtime_[car.player_id];

        if (runtime.turbo_active_time > 0.0) {
            runtime.turbo_active_time = std::max(0.0, runtime.turbo_active_time - dt);
        }

        if (car.turbo_charges < gameplay.max_turbo_charges && gameplay.turbo_recharge_seconds > 0.0) {
            runtime.turbo_recharge_progress += dt;
            if (runtime.turbo_recharge_progress >= gameplay.turbo_recharge_seconds) {
                int recovered = static_cast<int>(runtime.turbo_recharge_progress / gameplay.turbo_recharge_seconds);
                car.turbo_charges = std::min(gameplay.max_turbo_charges, car.turbo_charges + recovered);
                runtime.turbo_recharge_progress -= recovered * gameplay.turbo_recharge_seconds;
            }
        } else {
            runtime.turbo_recharge_progress = 0.0;
        }

        car.turbo_active = runtime.turbo_active_time > 0.0;
        car.turbo_duration_left = runtime.turbo_active_time;
        car.turbo_recharge = car.turbo_charges >= gameplay.max_turbo_charges
            ? 0.0
            : std::max(0.0, gameplay.turbo_recharge_seconds - runtime.turbo_recharge_progress);
    }
}

void Room::update_missile_charges(double dt) {
    const auto& gameplay = config_.gameplay();
    for (auto& car : cars_) {
        if (car.is_npc) continue;
        auto& runtime = runtime_[car.player_id];

        if (car.missile_charges < gameplay.max_missile_charges && gameplay.missile_recharge_seconds > 0.0) {
            runtime.missile_recharge_progress += dt;
            if (runtime.missile_recharge_progress >= gameplay.missile_recharge_seconds) {
                int recovered = static_cast<int>(runtime.missile_recharge_progress / gameplay.missile_recharge_seconds);
                car.missile_charges = std::min(gameplay.max_missile_charges, car.missile_charges + recovered);
                runtime.missile_recharge_progress -= recovered * gameplay.missile_recharge_seconds;
            }
        } else {
            runtime.missile_recharge_progress = 0.0;
        }

        car.missile_recharge = car.missile_charges >= gameplay.max_missile_charges
            ? 0.0
            : std::max(0.0, gameplay.missile_recharge_seconds - runtime.missile_recharge_progress);
    }
}

void Room::update_spin(double dt) {
    for (auto& car : cars_) {
        if (car.impact_spin_time_left <= 0.0) continue;
        auto& runtime = runtime_[car.player_id];
        car.speed = 0.0;
        car.angle = normalize_angle(car.angle + runtime.spin_angular_velocity * dt);
        car.impact_spin_time_left = std::max(0.0, car.impact_spin_time_left - dt);
        if (car.impact_spin_time_left <= 0.0) {
            runtime.spin_angular_velocity = 0.0;
        }
    }
}

void Room::update_item_respawns(double dt) {
    for (auto& slot : items_) {
        if (slot.active) continue;
        slot.respawn_timer -= dt;
        if (slot.respawn_timer <= 0.0) {
            slot.active = true;
            slot.respawn_timer = 0.0;
        }
    }
}

void Room::rebuild_car_index() {
    car_index_.reset(config_.network().spatial_hash_cell_size);
    for (size_t i = 0; i < cars_.size(); ++i) {
        car_index_.insert(static_cast<uint32_t>(i), cars_[i].x, cars_[i].z);
    }
}

void Room::cars_near(double x, double z, double radius, std::vector<uint32_t>& out) const {
    car_index_.query_indices(x, z, radius, out);
}

void Room::resolve_item_pickups() {
    const auto& gameplay = config_.gameplay();
    const double radius = gameplay.item_pickup_radius;
    const double radius_sq = radius * radius;

    for (auto& slot : items_) {
        if (!slot.active) continue;

        cars_near(slot.state.x, slot.state.z, radius, query_scratch_);
        for (uint32_t index : query_scratch_) {
            if (index >= cars_.size()) continue;
            auto& car = cars_[index];
            double dx = car.x - slot.state.x;
            double dz = car.z - slot.state.z;
            if (dx * dx + dz * dz > radius_sq) continue;

            if (slot.state.type == ItemType::Nitro) {
                car.turbo_charges = std::min(gameplay.max_turbo_charges, car.turbo_charges + 1);
            } else {
                car.missile_charges = std::min(gameplay.max_missile_charges, car.missile_charges + 1);
            }
            slot.active = false;
            slot.respawn_timer = gameplay.item_respawn_time;
            break;
        }
    }
}

std::string Room::acquire_target(const MissileState& missile) const {
    const double radius = config_.gameplay().missile_acquisition_radius;
    double best_sq = radius * radius;
    std::string best;
    const double forward_x = std::cos(missile.angle);
    const double forward_z = std::sin(missile.angle);

    cars_near(missile.x, missile.z, radius, query_scratch_);
    for (uint32_t index : query_scratch_) {
        if (index >= cars_.size()) continue;
        const auto& car = cars_[index];
        if (car.player_id == missile.owner_id) continue;
        double dx = car.x - missile.x;
        double dz = car.z - missile.z;
        // Only lock onto cars ahead of the missile
        if (dx * forward_x + dz * forward_z <= 0.0) continue;
        double dist_sq = dx * dx + dz * dz;
        if (dist_sq <= best_sq) {
            best_sq = dist_sq;
            best = car.player_id;
        }
    }
    return best;
}

void Room::apply_missile_impact(CarState& car) {
    const auto& gameplay = config_.gameplay();
    const double duration = std::max(0.01, gameplay.impact_spin_duration);
    car.speed = 0.0;
    car.impact_spin_time_left = duration;
    runtime_[car.player_id].spin_angular_velocity = gameplay.impact_spin_turns * TAU / duration;
}

void Room::update_missiles(double dt) {
    if (missiles_.empty()) return;
    const auto& gameplay = config_.gameplay();
    const double hit_sq = gameplay.missile_hit_radius * gameplay.missile_hit_radius;

    std::vector<std::string> removals;
    for (auto& runtime : missiles_) {
        auto& missile = runtime.state;
        const double travel = missile.speed * dt;

        if (!missile.target_id.empty() && !has_car(missile.target_id)) {
            missile.target_id.clear();
        }
        if (missile.target_id.empty()) {
            missile.target_id = acquire_target(missile);
        }

        if (CarState* target = missile.target_id.empty() ? nullptr : find_car(missile.target_id)) {
            double dx = target->x - missile.x;
            double dz = target->z - missile.z;
            double distance = std::hypot(dx, dz);
            if (distance * distance <= hit_sq || distance <= travel) {
                apply_missile_impact(*target);
                removals.push_back(missile.id);
                continue;
            }
            missile.angle = normalize_angle(std::atan2(dz, dx));
        }

        missile.x += std::cos(missile.angle) * travel;
        missile.z += std::sin(missile.angle) * travel;
        runtime.distance_travelled += travel;

        if (gameplay.missile_max_range > 0.0 && runtime.distance_travelled >= gameplay.missile_max_range) {
            removals.push_back(missile.id);
        }
    }

    if (!removals.empty()) {
        missiles_.erase(std::remove_if(missiles_.begin(), missiles_.end(),
                                       [&](const MissileRuntime& m) {
                                           return std::find(removals.begin(), removals.end(), m.state.id) != removals.end();
                                       }),
                        missiles_.end());
    }
}

// ============================================================================
// Snapshot
// ============================================================================

std::vector<MissileState> Room::missiles() const {
    std::vector<MissileState> out;
    out.reserve(missiles_.size());
    for (const auto& runtime : missiles_) {
        out.push_back(runtime.state);
    }
    return out;
}

std::vector<ItemState> Room::active_items() const {
    std::vector<ItemState> out;
    for (const auto& slot : items_) {
        if (slot.active) out.push_back(slot.state);
    }
    return out;
}

RoomState Room::state() const {
    RoomState state;
    state.room_id = room_id_;
    state.track_id = config_.track().id;
    state.server_time = server_time_;
    state.cars = cars_;
    state.missiles = missiles();
    state.items = active_items();
    state.radio = radio_;

    state.race.phase = RacePhase::Lobby;
    for (const auto& car : cars_) {
        RacePlayer player;
        player.player_id = car.player_id;
        player.username = car.username;
        player.is_npc = car.is_npc;
        state.race.players.push_back(std::move(player));
    }
    return state;
}

} // namespace racesync::server
