#include "viewer.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace racesync::client {

using namespace racesync::protocol;

namespace {

RoomSyncConfig make_sync_config(const ClientConfig& config) {
    RoomSyncConfig sync;
    sync.role = config.role;
    sync.room_id = config.room_id;
    sync.player_id = config.player_id;
    sync.session_token = config.session_token;
    return sync;
}

} // anonymous namespace

Viewer::Viewer(const ClientConfig& config)
    : config_(config)
    , sync_(store_, make_sync_config(config),
            [this](MessageType type, const nlohmann::json& payload) { network_.send(type, payload); })
    , entity_sync_(config.smoothing) {
}

Viewer::~Viewer() {
    shutdown();
}

bool Viewer::init() {
    network_.set_message_callback(
        [this](MessageType type, const std::vector<uint8_t>& payload) {
            sync_.handle_frame(type, payload);
        });
    network_.set_disconnect_callback(
        [this](const std::string& reason) {
            sync_.on_transport_disconnected(reason);
            running_ = false;
        });

    subscriptions_.push_back(store_.on_state([this](const RoomState& state) {
        entity_sync_.sync(registry_, state, store_.player_id());
    }));
    subscriptions_.push_back(store_.on_room_info([](const RoomInfoSnapshot& info) {
        std::cout << "[Viewer] Room " << info.room_id << ": " << info.players.size() << " player(s)" << std::endl;
    }));
    subscriptions_.push_back(sync_.on_error([](const std::string& message) {
        std::cerr << "[Viewer] " << message << std::endl;
    }));

    sync_.begin_connect();
    if (!network_.connect(config_.host, config_.port)) {
        std::cerr << "[Viewer] Failed to connect to server" << std::endl;
        sync_.on_transport_disconnected("connect failed");
        return false;
    }
    sync_.on_transport_connected();

    running_ = true;
    return true;
}

void Viewer::run() {
    using Clock = std::chrono::steady_clock;
    const auto frame_time = std::chrono::duration<double>(1.0 / std::max(1.0f, config_.frame_rate));
    auto last_frame = Clock::now();

    while (running_) {
        auto now = Clock::now();
        double dt = std::chrono::duration<double>(now - last_frame).count();
        last_frame = now;

        // Clamp delta time to avoid huge jumps
        if (dt > 0.1) dt = 0.1;

        network_.poll_messages();
        update(dt);

        std::this_thread::sleep_until(now + std::chrono::duration_cast<Clock::duration>(frame_time));
    }
}

void Viewer::shutdown() {
    for (auto& unsubscribe : subscriptions_) {
        unsubscribe();
    }
    subscriptions_.clear();
    network_.disconnect();
    entity_sync_.clear(registry_);
}

void Viewer::update(double dt) {
    motion_.update(registry_, dt);

    if (!username_sent_ && !config_.username.empty() && config_.role == PlayerRole::Controller &&
        sync_.state() == ConnectionState::Synchronized) {
        sync_.update_username(config_.username);
        username_sent_ = true;
    }

    if (config_.status_interval > 0.0f) {
        status_timer_ += dt;
        if (status_timer_ >= config_.status_interval) {
            status_timer_ = 0.0;
            print_status();
        }
    }
}

void Viewer::print_status() const {
    std::cout << "[Viewer] " << to_string(sync_.state())
              << " cars=" << store_.cars().size()
              << " missiles=" << store_.missiles().size()
              << " items=" << store_.items().size()
              << " entities=" << entity_sync_.entity_count()
              << " resyncs=" << sync_.resync_requests() << std::endl;
}

} // namespace racesync::client
