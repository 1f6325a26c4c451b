#include "memory_store.hpp"

StoreStatus MemoryStore::insert(const Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.insert(record);
}

LookupResult MemoryStore::lookup(const Query& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.lookup(query);
}

StoreStatus MemoryStore::update(const Query& query, const Bytes& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.update(query, payload);
}

StoreStatus MemoryStore::remove(const Query& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.remove(query);
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}
