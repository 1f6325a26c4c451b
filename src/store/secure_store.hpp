#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <core/types.hpp>
#include "record.hpp"

// Backend status code. Numbering follows the keychain's OSStatus space so
// the keychain backend can pass its codes through unchanged.
using StoreStatus = int32_t;

// ── Status codes ────────────────────────────────────────────
constexpr StoreStatus STATUS_SUCCESS        = 0;
constexpr StoreStatus STATUS_IO             = -36;
constexpr StoreStatus STATUS_PARAM          = -50;
constexpr StoreStatus STATUS_NOT_AVAILABLE  = -25291;
constexpr StoreStatus STATUS_DUPLICATE_ITEM = -25299;
constexpr StoreStatus STATUS_ITEM_NOT_FOUND = -25300;
constexpr StoreStatus STATUS_DECODE         = -26275;

struct LookupResult {
    StoreStatus status;
    std::optional<Bytes> payload;   // set only for return_data queries that succeed
};

// Narrow capability over an OS secure store. Each call is atomic on its own;
// nothing spans calls.
class SecureStore {
public:
    virtual ~SecureStore() = default;

    // Add a new record. DUPLICATE_ITEM if one with the same identity exists.
    virtual StoreStatus insert(const Record& record) = 0;

    // Find the first matching record.
    virtual LookupResult lookup(const Query& query) = 0;

    // Replace the payload of every matching record. ITEM_NOT_FOUND if none.
    virtual StoreStatus update(const Query& query, const Bytes& payload) = 0;

    // Delete every matching record. ITEM_NOT_FOUND if none.
    virtual StoreStatus remove(const Query& query) = 0;

    // Human-readable message for a status, for diagnostics only.
    virtual std::string describe(StoreStatus status) const;

    virtual const char* name() const = 0;
};
