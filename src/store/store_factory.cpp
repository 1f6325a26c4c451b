#include "store_factory.hpp"

#ifdef KVAULT_USE_KEYCHAIN
#include "keychain_store.hpp"
#else
#include "preference_file_store.hpp"
#endif

std::unique_ptr<SecureStore> make_platform_store(const VaultConfig& config) {
#ifdef KVAULT_USE_KEYCHAIN
    (void)config;
    return std::make_unique<KeychainStore>();
#else
    return std::make_unique<PreferenceFileStore>(config.store_path());
#endif
}
