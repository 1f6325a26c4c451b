#pragma once

#include <string>
#include <optional>
#include <memory>
#include <cstdint>
#include <core/config.hpp>
#include <core/types.hpp>
#include <store/secure_store.hpp>

enum class Operation { Set, Get, Update, Delete, Exists, Clear };

const char* operation_name(Operation op);

// Typed key/value access to a secure store, narrowed to one scope.
//
// Every call is synchronous and reduces its outcome to a bool or an
// optional; backend failures never escape as exceptions. Failure details
// go to the debug log when the config is verbose.
//
// set() inserts first and falls back to an update when the store reports a
// duplicate. A vault lacking a service name or access group first checks
// for a matching record and updates it, so get() returns what set() wrote. A remove() that lands between those two steps makes set()
// return false. Callers needing stronger guarantees serialize externally.
class Vault {
public:
    Vault(VaultConfig config, std::unique_ptr<SecureStore> store);

    // Vault on the platform store selected at build time.
    static Vault open(const VaultConfig& config);

    // Vault scoped to the given application identity.
    static Vault open_default(const std::string& application_id);

    bool set(const std::string& key, const std::string& value);
    bool set(const std::string& key, const char* value);
    bool set(const std::string& key, int32_t value);
    bool set(const std::string& key, int64_t value);
    bool set(const std::string& key, float value);
    bool set(const std::string& key, double value);
    bool set(const std::string& key, bool value);

    std::optional<std::string> get_string(const std::string& key);
    std::optional<int32_t> get_int32(const std::string& key);
    std::optional<int64_t> get_int64(const std::string& key);
    std::optional<float> get_float(const std::string& key);
    std::optional<double> get_double(const std::string& key);
    std::optional<bool> get_bool(const std::string& key);

    // Existence check; never fetches the payload.
    bool exists(const std::string& key);

    // Delete one entry. An already absent key counts as success.
    bool remove(const std::string& key);

    // Delete every entry in this vault's scope. Best effort.
    void clear();

    const VaultConfig& config() const { return config_; }
    const SecureStore& store() const { return *store_; }

private:
    bool set_payload(const std::string& key, const Bytes& payload);
    bool update(const std::string& key, const Bytes& payload);
    std::optional<Bytes> payload(const std::string& key);

    // Class + optional key + configured scope attributes.
    Query build_query(const std::string* key) const;

    // Maps a status to success. Logs failures when both the config and
    // the call site allow it.
    bool check(Operation op, StoreStatus status, bool verbose = true) const;

    void log(const std::string& msg) const;

    VaultConfig config_;
    std::unique_ptr<SecureStore> store_;
};
