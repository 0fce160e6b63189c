#include "credential_store.hpp"
#include "paths.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

template <typename T>
static Result<T> invalid_key(const std::string& key) {
    return Result<T>::Err(ErrorKind::InvalidKey,
                          fmt::format("Invalid key '{}': expected <section>.<key>", key));
}

template <typename T>
static Result<T> key_not_found(const std::string& key) {
    return Result<T>::Err(ErrorKind::KeyNotFound, fmt::format("Key '{}' not found", key));
}

CredentialStore::CredentialStore()
    : path_(resolve_credentials_path()) {}

CredentialStore::CredentialStore(const fs::path& path)
    : path_(resolve_credentials_path(path)) {}

void CredentialStore::init(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = resolve_credentials_path(path);
    cache_.reset();
}

void CredentialStore::reload() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.reset();
}

void CredentialStore::set_fresh_reads(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    fresh_reads_ = on;
}

bool CredentialStore::fresh_reads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fresh_reads_;
}

fs::path CredentialStore::path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path_;
}

bool CredentialStore::exists() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::exists(path_, ec);
}

// ── Load / persist ───────────────────────────────────────────

Result<void> CredentialStore::load_locked(bool force) {
    if (cache_ && !force && !fresh_reads_) {
        return Result<void>::Ok();
    }

    std::string text;
    try {
        std::error_code ec;
        bool present = fs::exists(path_, ec);
        if (ec) {
            return Result<void>::Err(ErrorKind::IOError,
                fmt::format("Cannot access {}: {}", path_.string(), ec.message()));
        }
        if (!present) {
            // Not created yet; the first set() writes it
            cache_ = CredentialFile{};
            return Result<void>::Ok();
        }
        if (fs::is_directory(path_)) {
            return Result<void>::Err(ErrorKind::IOError,
                fmt::format("{} is a directory", path_.string()));
        }

        std::ifstream f(path_, std::ios::binary);
        if (!f) {
            return Result<void>::Err(ErrorKind::IOError,
                fmt::format("Cannot open {}", path_.string()));
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        if (f.bad()) {
            return Result<void>::Err(ErrorKind::IOError,
                fmt::format("Cannot read {}", path_.string()));
        }
        text = ss.str();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::IOError,
            fmt::format("Cannot read {}: {}", path_.string(), e.what()));
    }

    auto parsed = CredentialFile::parse(text);
    if (parsed.is_err()) {
        return Result<void>::Err(ErrorKind::ParseError,
            fmt::format("{}: {}", path_.string(), parsed.error));
    }
    cache_ = std::move(parsed.value);
    return Result<void>::Ok();
}

Result<void> CredentialStore::persist_locked(const CredentialFile& file) {
    try {
        // Every directory we create is owner-only from the moment it exists;
        // existing ones are left as the user set them up
        std::vector<fs::path> missing;
        for (fs::path dir = path_.parent_path(); !dir.empty() && !fs::exists(dir);
             dir = dir.parent_path()) {
            missing.push_back(dir);
            if (dir == dir.root_path()) break;
        }
        for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
            platform::create_private_directory(*it);
        }

        platform::atomic_write_file(path_, file.serialize());
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::IOError,
            fmt::format("Failed to write {}: {}", path_.string(), e.what()));
    }
    return Result<void>::Ok();
}

// ── Reads ────────────────────────────────────────────────────

Result<Value> CredentialStore::get(const std::string& dotted_key) {
    auto parts = split_dotted_key(dotted_key);
    if (!parts) return invalid_key<Value>(dotted_key);

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked(false);
    if (loaded.is_err()) return Result<Value>::Err(loaded);

    const Value* v = cache_->find(parts->first, parts->second);
    if (!v) return key_not_found<Value>(dotted_key);
    return Result<Value>::Ok(*v);
}

Result<Value> CredentialStore::get(const std::string& dotted_key, const Value& fallback) {
    auto r = get(dotted_key);
    if (r.is_err() && r.kind == ErrorKind::KeyNotFound) {
        return Result<Value>::Ok(fallback);
    }
    return r;
}

Result<SectionEntries> CredentialStore::get_section(const std::string& section) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked(false);
    if (loaded.is_err()) return Result<SectionEntries>::Err(loaded);

    const auto* s = cache_->find_section(section);
    return Result<SectionEntries>::Ok(s ? s->entries : SectionEntries{});
}

Result<std::vector<SectionListing>> CredentialStore::list_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked(false);
    if (loaded.is_err()) return Result<std::vector<SectionListing>>::Err(loaded);
    return Result<std::vector<SectionListing>>::Ok(cache_->listing());
}

Result<std::vector<std::string>> CredentialStore::list_sections() {
    auto all = list_all();
    if (all.is_err()) return Result<std::vector<std::string>>::Err(all);

    std::vector<std::string> names;
    names.reserve(all.value.size());
    for (const auto& s : all.value) names.push_back(s.name);
    return Result<std::vector<std::string>>::Ok(std::move(names));
}

Result<std::vector<std::string>> CredentialStore::list_keys(const std::string& section) {
    auto all = list_all();
    if (all.is_err()) return Result<std::vector<std::string>>::Err(all);

    for (auto& s : all.value) {
        if (s.name == section) {
            return Result<std::vector<std::string>>::Ok(std::move(s.keys));
        }
    }
    return Result<std::vector<std::string>>::Ok({});
}

// ── Writes ───────────────────────────────────────────────────
// Both re-read the file so a copy cached earlier in this process never
// overwrites changes made by another process in between. The cache is
// only replaced once the write has succeeded.

Result<void> CredentialStore::set(const std::string& dotted_key, Value value) {
    auto parts = split_dotted_key(dotted_key);
    if (!parts) return invalid_key<void>(dotted_key);

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked(true);
    if (loaded.is_err()) return loaded;

    CredentialFile updated = *cache_;
    updated.set(parts->first, parts->second, std::move(value));

    auto saved = persist_locked(updated);
    if (saved.is_err()) return saved;

    cache_ = std::move(updated);
    return Result<void>::Ok();
}

Result<void> CredentialStore::remove(const std::string& dotted_key) {
    auto parts = split_dotted_key(dotted_key);
    if (!parts) return invalid_key<void>(dotted_key);

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked(true);
    if (loaded.is_err()) return loaded;

    CredentialFile updated = *cache_;
    if (!updated.remove(parts->first, parts->second)) {
        return key_not_found<void>(dotted_key);
    }

    auto saved = persist_locked(updated);
    if (saved.is_err()) return saved;

    cache_ = std::move(updated);
    return Result<void>::Ok();
}
