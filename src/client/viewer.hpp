#pragma once

#include "client/client_config.hpp"
#include "client/game_state_store.hpp"
#include "client/network_client.hpp"
#include "client/room_sync_client.hpp"
#include "client/systems/entity_sync_system.hpp"
#include "client/systems/motion_system.hpp"
#include <entt/entt.hpp>
#include <atomic>
#include <vector>

namespace racesync::client {

// Headless room viewer: keeps the store, the registry and the smoothers
// running against a live server, printing a status line now and then.
class Viewer {
public:
    explicit Viewer(const ClientConfig& config);
    ~Viewer();

    bool init();
    void run();
    void shutdown();

    // Safe to call from a signal handler thread
    void request_stop() { running_ = false; }

    const GameStateStore& store() const { return store_; }
    const entt::registry& registry() const { return registry_; }

private:
    void update(double dt);
    void print_status() const;

    ClientConfig config_;
    NetworkClient network_;
    GameStateStore store_;
    RoomSyncClient sync_;
    EntitySyncSystem entity_sync_;
    MotionSystem motion_;
    entt::registry registry_;

    std::vector<GameStateStore::Unsubscribe> subscriptions_;
    std::atomic<bool> running_{false};
    bool username_sent_ = false;
    double status_timer_ = 0.0;
};

} // namespace racesync::client
