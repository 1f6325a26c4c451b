#pragma once

#include <mutex>
#include "secure_store.hpp"
#include "record_table.hpp"

// Process-local store. Contents vanish with the object.
class MemoryStore : public SecureStore {
public:
    MemoryStore() = default;

    StoreStatus insert(const Record& record) override;
    LookupResult lookup(const Query& query) override;
    StoreStatus update(const Query& query, const Bytes& payload) override;
    StoreStatus remove(const Query& query) override;

    const char* name() const override { return "memory"; }

    size_t size() const;

private:
    mutable std::mutex mutex_;
    RecordTable table_;
};
