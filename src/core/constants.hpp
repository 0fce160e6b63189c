#pragma once

// ── Naming ──────────────────────────────────────────────────
constexpr const char* APP_NAME             = "aisafe";
constexpr const char* APP_VERSION          = "0.2.0";
constexpr const char* CREDENTIALS_FILENAME = "credentials.toml";
constexpr const char* CONFIG_FILENAME      = "config.yaml";
constexpr const char* DEBUG_LOG_FILENAME   = "aisafe_debug.log";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_CREDENTIALS_FILE = "AISAFE_FILE";   // overrides the default path
constexpr const char* ENV_XDG_CONFIG_HOME  = "XDG_CONFIG_HOME";
constexpr const char* ENV_APPDATA          = "APPDATA";       // Windows only

// ── Permissions (POSIX mode bits) ───────────────────────────
constexpr unsigned CREDENTIALS_DIR_MODE  = 0700;
constexpr unsigned CREDENTIALS_FILE_MODE = 0600;

// ── Hidden input ────────────────────────────────────────────
constexpr int PROMPT_TIMEOUT_MS = 60000;   // give up on an idle hidden prompt
