#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace racesync::protocol {

using json = nlohmann::json;

// Tolerant field readers: a missing key or a value of the wrong JSON type
// leaves the destination untouched, so defaults survive malformed payloads.

// Whole numbers and floats both decode, truncated toward zero. Values that do
// not fit T are rejected.
template<typename T>
bool read_integral(const json& v, T& out) {
    using limits = std::numeric_limits<T>;
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(limits::max())) return false;
        out = static_cast<T>(u);
        return true;
    }
    if (v.is_number_integer()) {
        auto i = v.get<int64_t>();
        if (i < 0) {
            if (!std::is_signed_v<T> || i < static_cast<int64_t>(limits::min())) return false;
        } else if (static_cast<uint64_t>(i) > static_cast<uint64_t>(limits::max())) {
            return false;
        }
        out = static_cast<T>(i);
        return true;
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return false;
        // min and max + 1 are zero or powers of two, so the bounds are exact doubles
        if (d <= static_cast<double>(limits::min()) - 1.0 ||
            d >= static_cast<double>(limits::max()) + 1.0) {
            return false;
        }
        out = static_cast<T>(d);
        return true;
    }
    return false;
}

template<typename T>
bool read_field(const json& j, const char* key, T& out) {
    if (!j.is_object()) return false;
    auto it = j.find(key);
    if (it == j.end()) return false;

    bool type_ok = false;
    if constexpr (std::is_same_v<T, bool>) {
        type_ok = it->is_boolean();
    } else if constexpr (std::is_integral_v<T>) {
        return read_integral(*it, out);
    } else if constexpr (std::is_arithmetic_v<T>) {
        type_ok = it->is_number();
    } else if constexpr (std::is_same_v<T, std::string>) {
        type_ok = it->is_string();
    }
    if (!type_ok) return false;

    out = it->get<T>();
    return true;
}

template<typename T>
bool read_optional(const json& j, const char* key, std::optional<T>& out) {
    T value{};
    if (!read_field(j, key, value)) return false;
    out = value;
    return true;
}

// Nullable numbers: JSON null and a missing key both decode to nullopt
inline void read_nullable(const json& j, const char* key, std::optional<double>& out) {
    out.reset();
    read_optional(j, key, out);
}

template<typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

inline void write_nullable(json& j, const char* key, const std::optional<double>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

inline void write_if_not_empty(json& j, const char* key, const std::string& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

} // namespace racesync::protocol
