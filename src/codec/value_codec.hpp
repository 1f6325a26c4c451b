#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

// Typed scalar <-> opaque payload conversion.
//
// Strings are stored as their UTF-8 bytes. Numbers and booleans are boxed:
// one marker byte carrying the type, then the value in little-endian order.
// Decoding never converts between types; a payload written for one type
// decodes as std::nullopt for every other type.
namespace codec {

enum class BoxType : uint8_t {
    Int32 = 1,
    Int64 = 2,
    Float32 = 3,
    Float64 = 4,
    Bool = 5,
};

Bytes encode(const std::string& value);
Bytes encode(int32_t value);
Bytes encode(int64_t value);
Bytes encode(float value);
Bytes encode(double value);
Bytes encode(bool value);

std::optional<std::string> decode_string(const Bytes& payload);
std::optional<int32_t> decode_int32(const Bytes& payload);
std::optional<int64_t> decode_int64(const Bytes& payload);
std::optional<float> decode_float(const Bytes& payload);
std::optional<double> decode_double(const Bytes& payload);
std::optional<bool> decode_bool(const Bytes& payload);

// Type tag of a boxed payload, or nullopt for strings and malformed data.
std::optional<BoxType> boxed_type(const Bytes& payload);

const char* box_type_name(BoxType type);

// Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF).
bool is_valid_utf8(const uint8_t* data, size_t len);

} // namespace codec
