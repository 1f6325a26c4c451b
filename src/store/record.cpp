#include "record.hpp"

const char* record_class_name(RecordClass cls) {
    switch (cls) {
        case RecordClass::GenericPassword: return "generic_password";
    }
    return "unknown";
}

static const std::string& value_or_empty(const std::optional<std::string>& v) {
    static const std::string empty;
    return v ? *v : empty;
}

bool matches(const Query& query, const Record& record) {
    if (query.record_class != record.record_class) return false;
    if (query.account && *query.account != record.account) return false;
    if (query.service && *query.service != value_or_empty(record.service)) return false;
    if (query.access_group && *query.access_group != value_or_empty(record.access_group)) {
        return false;
    }
    return true;
}

bool same_identity(const Record& a, const Record& b) {
    return a.record_class == b.record_class &&
           a.account == b.account &&
           value_or_empty(a.service) == value_or_empty(b.service) &&
           value_or_empty(a.access_group) == value_or_empty(b.access_group);
}
