#pragma once

#include <memory>
#include <core/config.hpp>
#include "secure_store.hpp"

// Backend for this build: the keychain when built with KVAULT_USE_KEYCHAIN,
// otherwise the preference file at config.store_path().
std::unique_ptr<SecureStore> make_platform_store(const VaultConfig& config);
