#include "network_client.hpp"
#include <iostream>
#include <utility>

namespace racesync::client {

using namespace racesync::protocol;

NetworkClient::NetworkClient()
    : socket_(io_context_) {
}

NetworkClient::~NetworkClient() {
    disconnect();
}

bool NetworkClient::connect(const std::string& host, uint16_t port) {
    try {
        tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(host, std::to_string(port));

        asio::connect(socket_, endpoints);
        connected_ = true;

        io_context_.restart();
        work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_context_));
        io_thread_ = std::thread(&NetworkClient::io_thread_func, this);

        asio::post(io_context_, [this]() { read_header(); });

        std::cout << "[NetworkClient] Connected to server " << host << ":" << port << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[NetworkClient] Connection failed: " << e.what() << std::endl;
        return false;
    }
}

void NetworkClient::disconnect() {
    if (!connected_ && !io_thread_.joinable()) return;

    connected_ = false;

    asio::post(io_context_, [this]() {
        asio::error_code ec;
        socket_.close(ec);
    });
    work_.reset();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    io_context_.stop();

    std::cout << "[NetworkClient] Disconnected from server" << std::endl;
}

void NetworkClient::send(MessageType type, const nlohmann::json& payload) {
    if (!connected_) return;

    auto data = build_packet(type, payload);
    asio::post(io_context_, [this, data = std::move(data)]() mutable {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(data));
        if (!writing_) {
            writing_ = true;
            do_write();
        }
    });
}

void NetworkClient::poll_messages() {
    std::queue<ReceivedMessage> messages;
    bool disconnected = false;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(message_mutex_);
        std::swap(messages, message_queue_);
        if (disconnect_pending_) {
            disconnected = true;
            reason = std::move(disconnect_reason_);
            disconnect_pending_ = false;
        }
    }

    while (!messages.empty()) {
        auto& msg = messages.front();
        if (message_callback_) {
            message_callback_(msg.type, msg.payload);
        }
        messages.pop();
    }

    if (disconnected && disconnect_callback_) {
        disconnect_callback_(reason);
    }
}

void NetworkClient::io_thread_func() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        std::cerr << "[NetworkClient] IO thread error: " << e.what() << std::endl;
        queue_disconnect(e.what());
    }
}

void NetworkClient::read_header() {
    asio::async_read(socket_,
        asio::buffer(header_buffer_),
        [this](asio::error_code ec, std::size_t /*length*/) {
            if (!ec) {
                current_header_.deserialize(header_buffer_);

                if (current_header_.payload_size > MAX_PAYLOAD_SIZE) {
                    std::cerr << "[NetworkClient] Oversized frame (" << current_header_.payload_size
                              << " bytes), closing" << std::endl;
                    asio::error_code close_ec;
                    socket_.close(close_ec);
                    queue_disconnect("oversized frame");
                } else if (current_header_.payload_size > 0) {
                    payload_buffer_.resize(current_header_.payload_size);
                    read_payload();
                } else {
                    payload_buffer_.clear();
                    queue_message();
                    read_header();
                }
            } else if (connected_) {
                std::cerr << "[NetworkClient] Read error: " << ec.message() << std::endl;
                queue_disconnect(ec.message());
            }
        });
}

void NetworkClient::read_payload() {
    asio::async_read(socket_,
        asio::buffer(payload_buffer_),
        [this](asio::error_code ec, std::size_t /*length*/) {
            if (!ec) {
                queue_message();
                read_header();
            } else if (connected_) {
                std::cerr << "[NetworkClient] Payload read error: " << ec.message() << std::endl;
                queue_disconnect(ec.message());
            }
        });
}

void NetworkClient::queue_message() {
    std::lock_guard<std::mutex> lock(message_mutex_);
    message_queue_.push({current_header_.type, payload_buffer_});
}

void NetworkClient::queue_disconnect(const std::string& reason) {
    connected_ = false;
    std::lock_guard<std::mutex> lock(message_mutex_);
    disconnect_reason_ = reason;
    disconnect_pending_ = true;
}

void NetworkClient::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    auto& front = write_queue_.front();
    asio::async_write(socket_,
        asio::buffer(front),
        [this](asio::error_code ec, std::size_t /*length*/) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!ec) {
                write_queue_.pop();
                if (!write_queue_.empty()) {
                    do_write();
                } else {
                    writing_ = false;
                }
            } else {
                std::cerr << "[NetworkClient] Write error: " << ec.message() << std::endl;
                while (!write_queue_.empty()) write_queue_.pop();
                writing_ = false;
            }
        });
}

} // namespace racesync::client
