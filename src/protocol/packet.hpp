#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/message_type.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace racesync::protocol {

// Frames larger than this are treated as a broken stream
constexpr uint32_t MAX_PAYLOAD_SIZE = 4u * 1024u * 1024u;

struct PacketHeader {
    MessageType type = MessageType::ErrorMessage;
    uint32_t payload_size = 0;

    static constexpr size_t serialized_size() { return sizeof(uint8_t) + sizeof(uint32_t); }

    void serialize(std::span<uint8_t> buf) const {
        BufferWriter w(buf);
        w.write(static_cast<uint8_t>(type));
        w.write(payload_size);
    }

    void deserialize(std::span<const uint8_t> data) {
        BufferReader r(data);
        type = static_cast<MessageType>(r.read<uint8_t>());
        payload_size = r.read<uint32_t>();
    }
};

// Build a ready-to-send packet: header (5 bytes) + JSON body.
// Invalid UTF-8 in strings is replaced rather than thrown on.
inline std::vector<uint8_t> build_packet(MessageType type, const nlohmann::json& payload) {
    const std::string body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::vector<uint8_t> data;
    data.reserve(PacketHeader::serialized_size() + body.size());
    BufferWriter w(data);
    w.write(static_cast<uint8_t>(type));
    w.write(static_cast<uint32_t>(body.size()));
    w.write_string(body);
    return data;
}

// Parse the JSON body of a received frame. Throws nlohmann::json::exception
// on malformed text; an empty payload decodes to an empty object.
inline nlohmann::json parse_payload(std::span<const uint8_t> payload) {
    if (payload.empty()) {
        return nlohmann::json::object();
    }
    BufferReader r(payload);
    return nlohmann::json::parse(r.read_remaining_string());
}

} // namespace racesync::protocol
