#pragma once

#include "secure_store.hpp"

// Apple keychain (generic password items) through the Security framework.
// Status codes are the raw OSStatus values returned by SecItem*.
class KeychainStore : public SecureStore {
public:
    KeychainStore() = default;

    StoreStatus insert(const Record& record) override;
    LookupResult lookup(const Query& query) override;
    StoreStatus update(const Query& query, const Bytes& payload) override;
    StoreStatus remove(const Query& query) override;

    std::string describe(StoreStatus status) const override;

    const char* name() const override { return "keychain"; }
};
