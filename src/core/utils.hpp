#pragma once

#include <string>
#include <utility>
#include <optional>

// Split "section.key" on the first '.'.
// Returns nullopt if there is no '.' or either side is empty.
std::optional<std::pair<std::string, std::string>> split_dotted_key(const std::string& key);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
