#include "record_table.hpp"
#include <algorithm>

StoreStatus RecordTable::insert(const Record& record) {
    for (const auto& r : records_) {
        if (same_identity(r, record)) return STATUS_DUPLICATE_ITEM;
    }
    records_.push_back(record);
    return STATUS_SUCCESS;
}

LookupResult RecordTable::lookup(const Query& query) const {
    for (const auto& r : records_) {
        if (!matches(query, r)) continue;
        if (query.return_data) return {STATUS_SUCCESS, r.data};
        return {STATUS_SUCCESS, std::nullopt};
    }
    return {STATUS_ITEM_NOT_FOUND, std::nullopt};
}

StoreStatus RecordTable::update(const Query& query, const Bytes& payload) {
    bool found = false;
    for (auto& r : records_) {
        if (matches(query, r)) {
            r.data = payload;
            found = true;
        }
    }
    return found ? STATUS_SUCCESS : STATUS_ITEM_NOT_FOUND;
}

StoreStatus RecordTable::remove(const Query& query) {
    auto it = std::remove_if(records_.begin(), records_.end(),
                             [&](const Record& r) { return matches(query, r); });
    if (it == records_.end()) return STATUS_ITEM_NOT_FOUND;
    records_.erase(it, records_.end());
    return STATUS_SUCCESS;
}
