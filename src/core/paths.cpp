#include "paths.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <cstdlib>
#include <string>
#include <system_error>

fs::path get_config_dir() {
    return platform::config_base_dir() / APP_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILENAME;
}

fs::path expand_user(const fs::path& p) {
    std::string s = p.string();
    if (s.empty() || s[0] != '~') return p;
    if (s.size() == 1) return platform::home_dir();
    if (s[1] == '/' || s[1] == '\\') return platform::home_dir() / s.substr(2);
    // "~user" forms are left alone
    return p;
}

static fs::path make_absolute(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs;
}

fs::path resolve_credentials_path(const std::optional<fs::path>& explicit_override) {
    if (explicit_override && !explicit_override->empty()) {
        return make_absolute(expand_user(*explicit_override));
    }

    const char* env = std::getenv(ENV_CREDENTIALS_FILE);
    if (env && *env) {
        return make_absolute(expand_user(fs::path(env)));
    }

    return make_absolute(get_config_dir() / CREDENTIALS_FILENAME);
}
