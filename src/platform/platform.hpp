#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the per-user configuration base directory:
//   Linux:   $XDG_CONFIG_HOME, else ~/.config
//   macOS:   ~/Library/Application Support
//   Windows: %APPDATA%, else the home directory
std::filesystem::path config_base_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Creates one directory, owner-only (0700) from the start.
// Returns false if it already exists; throws std::system_error otherwise.
bool create_private_directory(const std::filesystem::path& dir);

// Appends data to path, creating it owner read/write only. The file is
// put back to 0600 if it was looser, and a symlink at path is refused.
// Returns false on any failure.
bool append_owner_only(const std::filesystem::path& path, const std::string& data);

// Writes data to a new uniquely named file in dir, readable and writable by
// the owner only, flushed to disk. Returns the file's path.
// Throws std::system_error on failure (nothing is left behind).
std::filesystem::path write_temp_file(const std::filesystem::path& dir,
                                      const std::string& prefix,
                                      const std::string& data);

// Atomically replaces target with source (rename within one directory).
// Readers see either the old or the new file, never a partial one.
// Throws std::system_error / std::filesystem::filesystem_error on failure.
void replace_file(const std::filesystem::path& source,
                  const std::filesystem::path& target);

// write_temp_file + replace_file; the temporary is removed if the
// replace fails.
void atomic_write_file(const std::filesystem::path& target, const std::string& data);

// Whether stdin is attached to a terminal.
bool stdin_is_tty();

} // namespace platform
