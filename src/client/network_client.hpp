#pragma once

#include "protocol/protocol.hpp"
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace racesync::client {

// TCP transport. asio runs on a private IO thread that only frames bytes;
// received frames and the disconnect notice are queued and delivered from
// poll_messages() on the caller's thread.
class NetworkClient {
public:
    using tcp = asio::ip::tcp;
    using MessageCallback = std::function<void(racesync::protocol::MessageType, const std::vector<uint8_t>&)>;
    using DisconnectCallback = std::function<void(const std::string&)>;

    NetworkClient();
    ~NetworkClient();

    bool connect(const std::string& host, uint16_t port);
    void disconnect();
    bool is_connected() const { return connected_; }

    // Thread-safe
    void send(racesync::protocol::MessageType type, const nlohmann::json& payload);

    void set_message_callback(MessageCallback callback) { message_callback_ = std::move(callback); }
    void set_disconnect_callback(DisconnectCallback callback) { disconnect_callback_ = std::move(callback); }

    // Process received messages on main thread
    void poll_messages();

private:
    void io_thread_func();
    void read_header();
    void read_payload();
    void queue_message();
    void queue_disconnect(const std::string& reason);
    void do_write();

    asio::io_context io_context_;
    tcp::socket socket_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::atomic<bool> connected_{false};

    // Read buffer
    std::array<uint8_t, racesync::protocol::PacketHeader::serialized_size()> header_buffer_;
    std::vector<uint8_t> payload_buffer_;
    racesync::protocol::PacketHeader current_header_;

    // Write queue
    std::queue<std::vector<uint8_t>> write_queue_;
    std::mutex write_mutex_;
    bool writing_ = false;

    // Message queue for main thread
    struct ReceivedMessage {
        racesync::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };
    std::queue<ReceivedMessage> message_queue_;
    std::string disconnect_reason_;
    bool disconnect_pending_ = false;
    std::mutex message_mutex_;

    MessageCallback message_callback_;
    DisconnectCallback disconnect_callback_;
};

} // namespace racesync::client
