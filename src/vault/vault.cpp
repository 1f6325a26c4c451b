#include "vault.hpp"
#include <codec/value_codec.hpp>
#include <core/log.hpp>
#include <store/store_factory.hpp>
#include <fmt/format.h>

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Set:    return "Set";
        case Operation::Get:    return "Get";
        case Operation::Update: return "Update";
        case Operation::Delete: return "Delete";
        case Operation::Exists: return "Exists";
        case Operation::Clear:  return "Clear";
    }
    return "Unknown";
}

Vault::Vault(VaultConfig config, std::unique_ptr<SecureStore> store)
    : config_(std::move(config)), store_(std::move(store)) {}

Vault Vault::open(const VaultConfig& config) {
    return Vault(config, make_platform_store(config));
}

Vault Vault::open_default(const std::string& application_id) {
    return open(VaultConfig::for_application(application_id));
}

// ── Set ─────────────────────────────────────────────────────

bool Vault::set(const std::string& key, const std::string& value) {
    return set_payload(key, codec::encode(value));
}

bool Vault::set(const std::string& key, const char* value) {
    if (!value) return false;
    return set_payload(key, codec::encode(std::string(value)));
}

bool Vault::set(const std::string& key, int32_t value) {
    return set_payload(key, codec::encode(value));
}

bool Vault::set(const std::string& key, int64_t value) {
    return set_payload(key, codec::encode(value));
}

bool Vault::set(const std::string& key, float value) {
    return set_payload(key, codec::encode(value));
}

bool Vault::set(const std::string& key, double value) {
    return set_payload(key, codec::encode(value));
}

bool Vault::set(const std::string& key, bool value) {
    return set_payload(key, codec::encode(value));
}

// ── Get ─────────────────────────────────────────────────────

// Decode failures read as absent.
template <typename T, typename Decoder>
static std::optional<T> decode_or_log(const std::optional<Bytes>& data, Decoder decode,
                                      const char* type_name, const std::string& key,
                                      const Vault& vault) {
    if (!data) return std::nullopt;
    std::optional<T> value = decode(*data);
    if (!value && vault.config().verbose()) {
        auto boxed = codec::boxed_type(*data);
        kvault_log(vault.config().log_path(),
                   fmt::format("Operation -> Get: key '{}' does not hold a {} (holds {}, {} bytes)",
                               key, type_name,
                               boxed ? codec::box_type_name(*boxed) : "string or unknown",
                               data->size()));
    }
    return value;
}

std::optional<std::string> Vault::get_string(const std::string& key) {
    return decode_or_log<std::string>(payload(key), codec::decode_string, "string", key, *this);
}

std::optional<int32_t> Vault::get_int32(const std::string& key) {
    return decode_or_log<int32_t>(payload(key), codec::decode_int32, "int32", key, *this);
}

std::optional<int64_t> Vault::get_int64(const std::string& key) {
    return decode_or_log<int64_t>(payload(key), codec::decode_int64, "int64", key, *this);
}

std::optional<float> Vault::get_float(const std::string& key) {
    return decode_or_log<float>(payload(key), codec::decode_float, "float", key, *this);
}

std::optional<double> Vault::get_double(const std::string& key) {
    return decode_or_log<double>(payload(key), codec::decode_double, "double", key, *this);
}

std::optional<bool> Vault::get_bool(const std::string& key) {
    return decode_or_log<bool>(payload(key), codec::decode_bool, "bool", key, *this);
}

// ── Exists / delete / clear ─────────────────────────────────

bool Vault::exists(const std::string& key) {
    Query query = build_query(&key);
    query.return_data = false;
    return check(Operation::Exists, store_->lookup(query).status, false);
}

bool Vault::remove(const std::string& key) {
    StoreStatus status = store_->remove(build_query(&key));
    if (status == STATUS_ITEM_NOT_FOUND) return true;
    return check(Operation::Delete, status);
}

void Vault::clear() {
    StoreStatus status = store_->remove(build_query(nullptr));
    if (status == STATUS_ITEM_NOT_FOUND) return;
    check(Operation::Clear, status);
}

// ── Helpers ─────────────────────────────────────────────────

bool Vault::set_payload(const std::string& key, const Bytes& payload) {
    Record record;
    record.account = key;
    const Scope& scope = config_.scope();
    if (scope.has_service_name()) record.service = scope.service_name;
    if (scope.has_access_group()) record.access_group = scope.access_group;
    record.data = payload;

    // Without both scope attributes, reads match across scopes, so a record
    // stored elsewhere may already answer for this key. Overwrite it.
    if (!scope.has_service_name() || !scope.has_access_group()) {
        Query existing = build_query(&key);
        existing.return_data = false;
        if (store_->lookup(existing).status == STATUS_SUCCESS) {
            return update(key, payload);
        }
    }

    StoreStatus status = store_->insert(record);
    if (status == STATUS_DUPLICATE_ITEM) {
        return update(key, payload);
    }
    return check(Operation::Set, status);
}

bool Vault::update(const std::string& key, const Bytes& payload) {
    return check(Operation::Update, store_->update(build_query(&key), payload));
}

std::optional<Bytes> Vault::payload(const std::string& key) {
    Query query = build_query(&key);
    query.return_data = true;

    LookupResult result = store_->lookup(query);
    if (!check(Operation::Get, result.status)) return std::nullopt;
    return result.payload;
}

Query Vault::build_query(const std::string* key) const {
    Query query;
    query.record_class = RecordClass::GenericPassword;
    if (key) query.account = *key;

    const Scope& scope = config_.scope();
    if (scope.has_service_name()) query.service = scope.service_name;
    if (scope.has_access_group()) query.access_group = scope.access_group;
    return query;
}

bool Vault::check(Operation op, StoreStatus status, bool verbose) const {
    if (status == STATUS_SUCCESS) return true;
    if (config_.verbose() && verbose) {
        log(fmt::format("Operation -> {}: {} ({} status {})", operation_name(op),
                        store_->describe(status), store_->name(), status));
    }
    return false;
}

void Vault::log(const std::string& msg) const {
    kvault_log(config_.log_path(), msg);
}
