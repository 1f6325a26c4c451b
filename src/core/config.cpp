#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

// Empty optional strings behave like absent ones everywhere downstream;
// normalize here so accessors never hand out "".
static std::optional<std::string> non_empty(std::optional<std::string> v) {
    if (v && v->empty()) return std::nullopt;
    return v;
}

static std::optional<std::string> optional_scalar(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    if (!node.IsScalar()) {
        throw YAML::Exception(node.Mark(), "expected a scalar");
    }
    return non_empty(node.as<std::string>());
}

// Expand a leading "~/" against the home directory.
static fs::path expand_home(const std::string& raw) {
    if (raw.rfind("~/", 0) == 0) {
        return platform::home_dir() / raw.substr(2);
    }
    return fs::path(raw);
}

bool debug_env_enabled() {
    const char* v = std::getenv(ENV_DEBUG);
    return v && *v == '1';
}

fs::path get_kvault_dir() {
    return platform::home_dir() / KVAULT_DIR_NAME;
}

fs::path get_default_store_path() {
    const char* override_path = std::getenv(ENV_STORE_PATH);
    if (override_path && *override_path) {
        return expand_home(override_path);
    }
    return get_kvault_dir() / PREFERENCES_FILE_NAME;
}

VaultConfig::VaultConfig(Scope scope, bool verbose, fs::path log_path, fs::path store_path)
    : scope_{non_empty(std::move(scope.service_name)), non_empty(std::move(scope.access_group))},
      verbose_(verbose),
      log_path_(log_path.empty() ? default_log_path() : std::move(log_path)),
      store_path_(store_path.empty() ? get_default_store_path() : std::move(store_path)) {}

VaultConfig VaultConfig::for_application(const std::string& application_id) {
    Scope scope;
    scope.service_name = application_id.empty() ? std::string(DEFAULT_SERVICE_NAME)
                                                : application_id;
    return VaultConfig(scope, debug_env_enabled());
}

Result<VaultConfig> VaultConfig::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Result<VaultConfig>::Err("Cannot access config file " + path.string() +
                                            ": " + ec.message());
        }
        return Result<VaultConfig>::Err("Config file not found: " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<VaultConfig>::Ok(VaultConfig({}, debug_env_enabled()));
        }
        if (!root.IsMap()) {
            return Result<VaultConfig>::Err("Config root must be a mapping: " + path.string());
        }

        Scope scope;
        scope.service_name = optional_scalar(root["service_name"]);
        scope.access_group = optional_scalar(root["access_group"]);

        bool verbose = root["verbose"].as<bool>(false) || debug_env_enabled();

        fs::path log_path;
        if (auto p = optional_scalar(root["log_path"])) log_path = expand_home(*p);

        fs::path store_path;
        if (auto p = optional_scalar(root["store_path"])) store_path = expand_home(*p);

        return Result<VaultConfig>::Ok(VaultConfig(scope, verbose, log_path, store_path));
    } catch (const YAML::Exception& e) {
        return Result<VaultConfig>::Err(std::string("Failed to parse config: ") + e.what());
    }
}
