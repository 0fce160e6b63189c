#include "config.hpp"
#include "paths.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <system_error>
#include <utility>

// Read an optional boolean; false if present with a non-boolean value.
static bool read_flag(const YAML::Node& root, const char* name, bool& out) {
    const YAML::Node node = root[name];
    if (!node || node.IsNull()) return true;
    if (!node.IsScalar()) return false;
    try {
        out = node.as<bool>();
    } catch (const YAML::Exception&) {
        return false;
    }
    return true;
}

Result<Config> Config::load(const fs::path& path) {
    Config config;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Result<Config>::Err(ErrorKind::IOError,
                fmt::format("Cannot access {}: {}", path.string(), ec.message()));
        }
        return Result<Config>::Ok(config);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile& e) {
        return Result<Config>::Err(ErrorKind::IOError,
            fmt::format("Cannot read {}: {}", path.string(), e.what()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ParseError,
            fmt::format("{}: {}", path.string(), e.what()));
    }

    // An empty file parses to a null node
    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err(ErrorKind::ParseError,
            fmt::format("{}: expected a mapping at the top level", path.string()));
    }

    const std::pair<const char*, bool*> flags[] = {
        {"color",       &config.color_},
        {"fresh_reads", &config.fresh_reads_},
        {"debug_log",   &config.debug_log_},
    };
    for (const auto& [name, target] : flags) {
        if (!read_flag(root, name, *target)) {
            return Result<Config>::Err(ErrorKind::ParseError,
                fmt::format("{}: '{}' must be true or false", path.string(), name));
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load() {
    return load(get_config_path());
}
