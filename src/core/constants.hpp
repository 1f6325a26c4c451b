#pragma once

// ── Defaults ────────────────────────────────────────────────
// Service name used when the application identity is unknown.
constexpr const char* DEFAULT_SERVICE_NAME  = "com.liftric.KVault";
constexpr const char* KVAULT_DIR_NAME       = ".kvault";
constexpr const char* PREFERENCES_FILE_NAME = "preferences.yaml";
constexpr const char* DEBUG_LOG_FILE_NAME   = "kvault_debug.log";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_DEBUG      = "KVAULT_DEBUG";       // "1" forces verbose logging
constexpr const char* ENV_STORE_PATH = "KVAULT_STORE_PATH";  // preference file override

// ── Codec ───────────────────────────────────────────────────
// Boxed values start with a byte that never appears in valid UTF-8.
constexpr unsigned char BOX_MARKER = 0xF8;
