#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Immutable settings shared by every operation of a Vault.
class VaultConfig {
public:
    explicit VaultConfig(Scope scope = {},
                         bool verbose = false,
                         fs::path log_path = {},
                         fs::path store_path = {});

    // Default scope bound to an application identity (bundle id, package name).
    // An empty identity falls back to DEFAULT_SERVICE_NAME.
    static VaultConfig for_application(const std::string& application_id);

    // Load from a YAML file. KVAULT_DEBUG=1 forces verbose on.
    static Result<VaultConfig> load(const fs::path& path);

    // Accessors
    const Scope& scope() const { return scope_; }
    bool verbose() const { return verbose_; }
    const fs::path& log_path() const { return log_path_; }
    const fs::path& store_path() const { return store_path_; }

private:
    Scope scope_;
    bool verbose_;
    fs::path log_path_;
    fs::path store_path_;
};

// True when KVAULT_DEBUG is set to "1".
bool debug_env_enabled();

// Get paths
fs::path get_kvault_dir();
fs::path get_default_store_path();
