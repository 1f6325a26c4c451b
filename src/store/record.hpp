#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Item classes understood by the stores. Only generic passwords are used.
enum class RecordClass {
    GenericPassword,
};

const char* record_class_name(RecordClass cls);

// Attribute query. Unset attributes match any value.
struct Query {
    RecordClass record_class = RecordClass::GenericPassword;
    std::optional<std::string> account;       // entry key; unset for class-wide queries
    std::optional<std::string> service;
    std::optional<std::string> access_group;
    bool return_data = false;                 // lookup: materialize the payload
};

// A stored item. Absent attributes are stored as absent, not as "".
struct Record {
    RecordClass record_class = RecordClass::GenericPassword;
    std::string account;
    std::optional<std::string> service;
    std::optional<std::string> access_group;
    Bytes data;
};

// True when every attribute set on the query equals the record's value.
bool matches(const Query& query, const Record& record);

// True when both records occupy the same slot (class, account, service, group).
bool same_identity(const Record& a, const Record& b);
