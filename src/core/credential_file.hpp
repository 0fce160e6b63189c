#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// In-memory credentials document: named sections of typed scalars,
// both levels kept in first-seen order.
//
// On disk it is a TOML subset:
//
//   [database]
//   host = "localhost"
//   port = 5432
//   password = "s3cret"
//
// Anything deeper than [section] / key = scalar (dotted headers or keys,
// inline tables, arrays, arrays of tables) is rejected, as are keys
// that appear before the first section header.
class CredentialFile {
public:
    struct Section {
        std::string name;
        SectionEntries entries;
    };

    // Parse file contents. Fails with ErrorKind::ParseError, the message
    // carries the 1-based line number.
    static Result<CredentialFile> parse(const std::string& text);

    // Section-then-key order, a blank line between sections.
    // parse(serialize()) reproduces the same document.
    std::string serialize() const;

    const Section* find_section(const std::string& name) const;

    // nullptr when either the section or the key is absent
    const Value* find(const std::string& section, const std::string& key) const;

    // Creates the section if needed. An existing key keeps its position.
    void set(const std::string& section, const std::string& key, Value value);

    // Erases the key and leaves the section in place, even when it ends up
    // empty. Returns false if there was nothing to erase.
    bool remove(const std::string& section, const std::string& key);

    std::vector<SectionListing> listing() const;

    const std::vector<Section>& sections() const { return sections_; }
    bool empty() const { return sections_.empty(); }

private:
    // Index of the named section, appended if absent
    size_t section_index(const std::string& name);

    std::vector<Section> sections_;
};

// TOML literal for a value: strings quoted and escaped, floats always
// recognisable as floats ("1.0", "1e+20", "inf").
std::string value_literal(const Value& v);

// Human display: strings verbatim, everything else as its literal.
std::string format_value(const Value& v);

// "string", "integer", "float" or "boolean"
const char* value_kind_name(const Value& v);

// Whether name can be written without quotes (A-Za-z0-9_-, non-empty).
bool is_bare_key(const std::string& name);
