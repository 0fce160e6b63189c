#pragma once

#include <string>
#include <vector>
#include <variant>
#include <utility>
#include <cstdint>

// Failure categories surfaced by the store. Callers branch on these,
// the message is for humans.
enum class ErrorKind {
    None,
    InvalidKey,     // dotted key without '.', or an empty component
    KeyNotFound,    // section or key absent and no default supplied
    ParseError,     // file is not valid for the two-level format
    IOError,        // read / write / rename / mkdir failed
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:        return "none";
        case ErrorKind::InvalidKey:  return "invalid key";
        case ErrorKind::KeyNotFound: return "key not found";
        case ErrorKind::ParseError:  return "parse error";
        case ErrorKind::IOError:     return "I/O error";
    }
    return "unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    ErrorKind kind;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, kind, err};
    }

    // Re-wrap another result's failure
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.kind, other.error};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    ErrorKind kind;
    std::string error;

    static Result<void> Ok() {
        return {true, ErrorKind::None, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, kind, err};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.kind, other.error};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Scalar stored under a key. The alternative is picked from the literal
// syntax at parse time: quoted = string, digits = integer, '.'/exponent =
// float, true/false = boolean.
using Value = std::variant<std::string, int64_t, double, bool>;

// Key/value pairs of one section, in file order
using SectionEntries = std::vector<std::pair<std::string, Value>>;

// Structure listing: one section name and its keys, no values
struct SectionListing {
    std::string name;
    std::vector<std::string> keys;
};
