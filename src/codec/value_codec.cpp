#include "value_codec.hpp"
#include <core/constants.hpp>
#include <cstring>

namespace codec {

namespace {

template <typename U>
Bytes box(BoxType type, U bits) {
    Bytes out;
    out.reserve(1 + sizeof(U));
    out.push_back(static_cast<uint8_t>(BOX_MARKER + static_cast<uint8_t>(type)));
    for (size_t i = 0; i < sizeof(U); i++) {
        out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
    }
    return out;
}

// Returns the little-endian body of a boxed payload when tag and width match.
template <typename U>
std::optional<U> unbox(const Bytes& payload, BoxType type) {
    if (payload.size() != 1 + sizeof(U)) return std::nullopt;
    if (payload[0] != static_cast<uint8_t>(BOX_MARKER + static_cast<uint8_t>(type))) {
        return std::nullopt;
    }
    U bits = 0;
    for (size_t i = 0; i < sizeof(U); i++) {
        bits |= static_cast<U>(payload[1 + i]) << (8 * i);
    }
    return bits;
}

} // namespace

Bytes encode(const std::string& value) {
    return Bytes(value.begin(), value.end());
}

Bytes encode(int32_t value) {
    return box(BoxType::Int32, static_cast<uint32_t>(value));
}

Bytes encode(int64_t value) {
    return box(BoxType::Int64, static_cast<uint64_t>(value));
}

Bytes encode(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return box(BoxType::Float32, bits);
}

Bytes encode(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return box(BoxType::Float64, bits);
}

Bytes encode(bool value) {
    return box(BoxType::Bool, static_cast<uint8_t>(value ? 1 : 0));
}

std::optional<std::string> decode_string(const Bytes& payload) {
    if (!is_valid_utf8(payload.data(), payload.size())) return std::nullopt;
    return std::string(payload.begin(), payload.end());
}

std::optional<int32_t> decode_int32(const Bytes& payload) {
    auto bits = unbox<uint32_t>(payload, BoxType::Int32);
    if (!bits) return std::nullopt;
    return static_cast<int32_t>(*bits);
}

std::optional<int64_t> decode_int64(const Bytes& payload) {
    auto bits = unbox<uint64_t>(payload, BoxType::Int64);
    if (!bits) return std::nullopt;
    return static_cast<int64_t>(*bits);
}

std::optional<float> decode_float(const Bytes& payload) {
    auto bits = unbox<uint32_t>(payload, BoxType::Float32);
    if (!bits) return std::nullopt;
    float value;
    std::memcpy(&value, &*bits, sizeof(value));
    return value;
}

std::optional<double> decode_double(const Bytes& payload) {
    auto bits = unbox<uint64_t>(payload, BoxType::Float64);
    if (!bits) return std::nullopt;
    double value;
    std::memcpy(&value, &*bits, sizeof(value));
    return value;
}

std::optional<bool> decode_bool(const Bytes& payload) {
    auto bits = unbox<uint8_t>(payload, BoxType::Bool);
    if (!bits || *bits > 1) return std::nullopt;
    return *bits == 1;
}

std::optional<BoxType> boxed_type(const Bytes& payload) {
    if (payload.empty()) return std::nullopt;
    uint8_t tag = payload[0];
    if (tag <= BOX_MARKER || tag > BOX_MARKER + static_cast<uint8_t>(BoxType::Bool)) {
        return std::nullopt;
    }
    return static_cast<BoxType>(tag - BOX_MARKER);
}

const char* box_type_name(BoxType type) {
    switch (type) {
        case BoxType::Int32:   return "int32";
        case BoxType::Int64:   return "int64";
        case BoxType::Float32: return "float";
        case BoxType::Float64: return "double";
        case BoxType::Bool:    return "bool";
    }
    return "unknown";
}

bool is_valid_utf8(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint8_t c = data[i];
        if (c < 0x80) { i++; continue; }

        size_t extra;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0)      { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= len) return false;
        for (size_t k = 1; k <= extra; k++) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((extra == 1 && cp < 0x80) ||
            (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += extra + 1;
    }
    return true;
}

} // namespace codec
