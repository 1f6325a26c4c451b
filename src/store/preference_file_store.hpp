#pragma once

#include <mutex>
#include <filesystem>
#include "secure_store.hpp"
#include "record_table.hpp"

namespace fs = std::filesystem;

// Records persisted as YAML in a single per-user file (chmod 600).
// Payloads are base64 encoded. Protection at rest is the operating
// system's: file ownership, permissions, and whatever disk encryption
// the user has.
class PreferenceFileStore : public SecureStore {
public:
    explicit PreferenceFileStore(fs::path path);

    StoreStatus insert(const Record& record) override;
    LookupResult lookup(const Query& query) override;
    StoreStatus update(const Query& query, const Bytes& payload) override;
    StoreStatus remove(const Query& query) override;

    const char* name() const override { return "preference-file"; }

    const fs::path& path() const { return path_; }

private:
    // Read every record. A missing file is an empty table.
    StoreStatus read_all(RecordTable& out) const;

    // Rewrite the file from the table.
    StoreStatus write_all(const RecordTable& table) const;

    fs::path path_;
    mutable std::mutex mutex_;
};
