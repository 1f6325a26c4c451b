#include "preference_file_store.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <system_error>

// File layout:
//
//   records:
//     - class: generic_password
//       account: token
//       service: app.test        # omitted when unset
//       access_group: group.x    # omitted when unset
//       data: YWJjMTIz           # base64 payload

static bool parse_record_class(const std::string& name, RecordClass& out) {
    if (name == record_class_name(RecordClass::GenericPassword)) {
        out = RecordClass::GenericPassword;
        return true;
    }
    return false;
}

static std::optional<std::string> optional_field(const YAML::Node& n, const char* key) {
    if (!n[key] || n[key].IsNull()) return std::nullopt;
    return n[key].as<std::string>();
}

PreferenceFileStore::PreferenceFileStore(fs::path path) : path_(std::move(path)) {}

StoreStatus PreferenceFileStore::read_all(RecordTable& out) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) return STATUS_IO;
        out = RecordTable{};
        return STATUS_SUCCESS;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        std::vector<Record> records;

        if (root.IsNull()) {
            out = RecordTable{};
            return STATUS_SUCCESS;
        }
        if (!root.IsMap()) return STATUS_DECODE;

        const YAML::Node list = root["records"];
        if (list && !list.IsNull()) {
            if (!list.IsSequence()) return STATUS_DECODE;
            for (const auto& n : list) {
                if (!n.IsMap()) return STATUS_DECODE;
                Record r;
                if (!parse_record_class(n["class"].as<std::string>(""), r.record_class)) {
                    return STATUS_DECODE;
                }
                if (!n["account"] || !n["account"].IsScalar()) return STATUS_DECODE;
                r.account = n["account"].as<std::string>();
                r.service = optional_field(n, "service");
                r.access_group = optional_field(n, "access_group");

                std::string encoded = n["data"].as<std::string>("");
                std::vector<unsigned char> raw = YAML::DecodeBase64(encoded);
                if (raw.empty() && !encoded.empty()) return STATUS_DECODE;
                r.data.assign(raw.begin(), raw.end());

                records.push_back(std::move(r));
            }
        }

        out = RecordTable(std::move(records));
        return STATUS_SUCCESS;
    } catch (const YAML::BadFile&) {
        return STATUS_IO;
    } catch (const YAML::Exception&) {
        // Corrupted store file: refuse to touch it
        return STATUS_DECODE;
    }
}

StoreStatus PreferenceFileStore::write_all(const RecordTable& table) const {
    std::error_code ec;
    if (!path_.parent_path().empty()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) return STATUS_IO;
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "records" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : table.records()) {
        out << YAML::BeginMap;
        out << YAML::Key << "class" << YAML::Value << record_class_name(r.record_class);
        out << YAML::Key << "account" << YAML::Value << r.account;
        if (r.service) {
            out << YAML::Key << "service" << YAML::Value << *r.service;
        }
        if (r.access_group) {
            out << YAML::Key << "access_group" << YAML::Value << *r.access_group;
        }
        out << YAML::Key << "data" << YAML::Value
            << YAML::EncodeBase64(r.data.data(), r.data.size());
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    if (!out.good()) return STATUS_PARAM;

    // Write beside the target with owner-only permissions, then swap in.
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) return STATUS_IO;
        if (!platform::restrict_to_owner(tmp)) {
            f.close();
            fs::remove(tmp, ec);
            return STATUS_IO;
        }
        f << out.c_str() << "\n";
        f.close();
        if (!f) {
            fs::remove(tmp, ec);
            return STATUS_IO;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return STATUS_IO;
    }
    return STATUS_SUCCESS;
}

StoreStatus PreferenceFileStore::insert(const Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordTable table;
    StoreStatus st = read_all(table);
    if (st != STATUS_SUCCESS) return st;

    st = table.insert(record);
    if (st != STATUS_SUCCESS) return st;
    return write_all(table);
}

LookupResult PreferenceFileStore::lookup(const Query& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordTable table;
    StoreStatus st = read_all(table);
    if (st != STATUS_SUCCESS) return {st, std::nullopt};
    return table.lookup(query);
}

StoreStatus PreferenceFileStore::update(const Query& query, const Bytes& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordTable table;
    StoreStatus st = read_all(table);
    if (st != STATUS_SUCCESS) return st;

    st = table.update(query, payload);
    if (st != STATUS_SUCCESS) return st;
    return write_all(table);
}

StoreStatus PreferenceFileStore::remove(const Query& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordTable table;
    StoreStatus st = read_all(table);
    if (st != STATUS_SUCCESS) return st;

    st = table.remove(query);
    if (st != STATUS_SUCCESS) return st;
    return write_all(table);
}
