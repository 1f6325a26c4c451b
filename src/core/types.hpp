#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Opaque payload bytes as handed to a secure store
using Bytes = std::vector<uint8_t>;

// Visibility scope of stored entries. Empty strings count as unset.
struct Scope {
    std::optional<std::string> service_name;
    std::optional<std::string> access_group;

    bool has_service_name() const { return service_name && !service_name->empty(); }
    bool has_access_group() const { return access_group && !access_group->empty(); }
};
