#pragma once

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

// Credentials file location. Precedence, highest first:
//   1. explicit_override (e.g. CredentialStore(path) or --file)
//   2. $AISAFE_FILE, if set and non-empty
//   3. get_config_dir() / "credentials.toml"
// "~" is expanded in 1 and 2, and the result is made absolute.
// Never touches the filesystem and never fails; the file may not exist yet.
fs::path resolve_credentials_path(const std::optional<fs::path>& explicit_override = std::nullopt);

// Platform config base joined with "aisafe":
//   Linux:   $XDG_CONFIG_HOME/aisafe or ~/.config/aisafe
//   macOS:   ~/Library/Application Support/aisafe
//   Windows: %APPDATA%\aisafe
fs::path get_config_dir();

// YAML settings file read by the CLI
fs::path get_config_path();

// Replace a leading "~" or "~/" with the home directory.
fs::path expand_user(const fs::path& p);
