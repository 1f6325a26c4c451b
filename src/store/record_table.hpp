#pragma once

#include <vector>
#include "secure_store.hpp"

// Plain record list with secure-store semantics. Not synchronized; owners lock.
class RecordTable {
public:
    RecordTable() = default;
    explicit RecordTable(std::vector<Record> records) : records_(std::move(records)) {}

    StoreStatus insert(const Record& record);
    LookupResult lookup(const Query& query) const;
    StoreStatus update(const Query& query, const Bytes& payload);
    StoreStatus remove(const Query& query);

    const std::vector<Record>& records() const { return records_; }
    size_t size() const { return records_.size(); }

private:
    std::vector<Record> records_;
};
