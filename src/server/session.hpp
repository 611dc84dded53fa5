#pragma once

#include "protocol/packet.hpp"
#include "server/room.hpp"
#include <asio.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

namespace racesync::server {

class Server;

// One TCP connection: framed reads, JSON decode, dispatch to the Server,
// and a write queue. Runs entirely on the io_context thread.
class Session : public std::enable_shared_from_this<Session> {
public:
    using tcp = asio::ip::tcp;

    Session(tcp::socket socket, Server& server, ConnectionId id);

    void start();
    void send(const std::vector<uint8_t>& data);
    void close();

    ConnectionId id() const { return id_; }
    bool is_open() const { return socket_.is_open(); }

private:
    void read_header();
    void read_payload();
    void handle_packet();
    void do_write();
    void fail(const char* what, const asio::error_code& ec);

    tcp::socket socket_;
    Server& server_;
    ConnectionId id_;
    bool disconnected_ = false;

    // Read buffer
    std::array<uint8_t, protocol::PacketHeader::serialized_size()> header_buffer_;
    std::vector<uint8_t> payload_buffer_;
    protocol::PacketHeader current_header_;

    // Write queue
    std::deque<std::vector<uint8_t>> write_queue_;
    bool writing_ = false;
};

} // namespace racesync::server
