#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "credential_file.hpp"

namespace fs = std::filesystem;

// Dotted-key ("section.key") access to one credentials file.
//
// The file is loaded lazily and cached; mutating calls always re-read the
// file first, then write the whole document to a temporary file in the
// same directory and rename it over the target, so readers never see a
// partial file. Calls on one store are serialized by an internal mutex.
// Separate processes are not coordinated: concurrent writers race and the
// last rename wins.
//
// Nothing here logs; failures come back as Result with an ErrorKind.
class CredentialStore {
public:
    // Uses resolve_credentials_path(): $AISAFE_FILE or the OS default
    CredentialStore();

    // Uses the given file (tilde-expanded), same as init(path)
    explicit CredentialStore(const fs::path& path);

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    // Point the store at another file and drop the cached document.
    void init(const fs::path& path);

    // Drop the cached document; the next read goes to disk.
    void reload();

    // When on, every read re-reads the file instead of using the cache.
    void set_fresh_reads(bool on);
    bool fresh_reads() const;

    fs::path path() const;

    // Whether the credentials file has been created yet
    bool exists() const;

    // InvalidKey on a malformed key, KeyNotFound if absent
    Result<Value> get(const std::string& dotted_key);

    // Like get(), but an absent key yields fallback instead of KeyNotFound
    Result<Value> get(const std::string& dotted_key, const Value& fallback);

    // Copy of one section's entries; empty if the section does not exist
    Result<SectionEntries> get_section(const std::string& section);

    // Creates the section if needed, overwrites in place or appends
    Result<void> set(const std::string& dotted_key, Value value);

    // KeyNotFound if absent. The section stays, even if now empty.
    Result<void> remove(const std::string& dotted_key);

    // Every section and its keys in file order, without values
    Result<std::vector<SectionListing>> list_all();

    Result<std::vector<std::string>> list_sections();

    // Keys of one section; empty if the section does not exist
    Result<std::vector<std::string>> list_keys(const std::string& section);

private:
    Result<void> load_locked(bool force);
    Result<void> persist_locked(const CredentialFile& file);

    mutable std::mutex mutex_;
    fs::path path_;
    std::optional<CredentialFile> cache_;
    bool fresh_reads_ = false;
};
