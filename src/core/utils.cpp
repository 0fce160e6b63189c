#include "utils.hpp"

std::optional<std::pair<std::string, std::string>> split_dotted_key(const std::string& key) {
    auto dot = key.find('.');
    if (dot == std::string::npos) return std::nullopt;

    std::string section = key.substr(0, dot);
    std::string field = key.substr(dot + 1);
    if (section.empty() || field.empty()) return std::nullopt;

    return std::make_pair(std::move(section), std::move(field));
}
