#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>

namespace racesync::protocol {

// Bounds-checked reader over a received frame
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

    void check_bounds(size_t n) const {
        if (offset_ + n > data_.size()) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

public:
    explicit BufferReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    T read() {
        check_bounds(sizeof(T));
        T val;
        std::memcpy(&val, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return val;
    }

    // Consumes everything that is left as raw text (JSON payload body)
    std::string read_remaining_string() {
        std::string str(reinterpret_cast<const char*>(data_.data() + offset_), data_.size() - offset_);
        offset_ = data_.size();
        return str;
    }

    size_t offset() const { return offset_; }
    size_t remaining_size() const { return data_.size() - offset_; }
};

} // namespace racesync::protocol
