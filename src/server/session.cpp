#include "session.hpp"
#include "protocol/protocol.hpp"
#include "server.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace racesync::server {

using namespace racesync::protocol;

Session::Session(tcp::socket socket, Server& server, ConnectionId id)
    : socket_(std::move(socket))
    , server_(server)
    , id_(id) {
}

void Session::start() {
    read_header();
}

void Session::send(const std::vector<uint8_t>& data) {
    if (!socket_.is_open()) return;
    write_queue_.push_back(data);
    if (!writing_) {
        writing_ = true;
        do_write();
    }
}

void Session::close() {
    asio::error_code ec;
    socket_.close(ec);
}

void Session::fail(const char* what, const asio::error_code& ec) {
    if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        std::cout << "[Session " << id_ << "] " << what << ": " << ec.message() << std::endl;
    }
    close();
    if (!disconnected_) {
        disconnected_ = true;
        server_.on_disconnect(id_);
    }
}

void Session::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_,
        asio::buffer(header_buffer_),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            if (ec) {
                fail("read error", ec);
                return;
            }
            current_header_.deserialize(header_buffer_);
            if (current_header_.payload_size > MAX_PAYLOAD_SIZE) {
                std::cout << "[Session " << id_ << "] Payload of " << current_header_.payload_size
                          << " bytes exceeds limit, closing" << std::endl;
                fail("oversized frame", asio::error::message_size);
                return;
            }
            if (current_header_.payload_size > 0) {
                payload_buffer_.resize(current_header_.payload_size);
                read_payload();
            } else {
                payload_buffer_.clear();
                handle_packet();
                read_header();
            }
        });
}

void Session::read_payload() {
    auto self = shared_from_this();
    asio::async_read(socket_,
        asio::buffer(payload_buffer_),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            if (ec) {
                fail("payload read error", ec);
                return;
            }
            handle_packet();
            read_header();
        });
}

void Session::handle_packet() {
    auto self = shared_from_this();
    try {
        nlohmann::json payload = parse_payload(payload_buffer_);

        switch (current_header_.type) {
            case MessageType::JoinRoom:
                server_.on_join_room(self, payload.get<JoinRoomMsg>());
                break;

            case MessageType::RequestStateFull:
                server_.on_request_state_full(self, payload.get<RequestStateFullMsg>());
                break;

            case MessageType::Input:
                server_.on_input(self, payload.get<InputMsg>());
                break;

            case MessageType::UpdateUsername:
                server_.on_update_username(self, payload.get<UsernameUpdateMsg>());
                break;

            case MessageType::RadioCycle:
                server_.on_radio_cycle(self, payload.get<RadioCycleMsg>());
                break;

            default:
                std::cout << "[Session " << id_ << "] Unexpected message type: "
                          << static_cast<int>(current_header_.type) << std::endl;
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        std::cout << "[Session " << id_ << "] Dropping malformed "
                  << to_event_name(current_header_.type) << ": " << e.what() << std::endl;
    }
}

void Session::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    auto self = shared_from_this();
    asio::async_write(socket_,
        asio::buffer(write_queue_.front()),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            if (!ec) {
                write_queue_.pop_front();
                do_write();
            } else {
                write_queue_.clear();
                writing_ = false;
                fail("write error", ec);
            }
        });
}

} // namespace racesync::server
