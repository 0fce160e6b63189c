#pragma once

#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Colors are on unless config.yaml says `color: false`
inline bool& colors_enabled() {
    static bool enabled = true;
    return enabled;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return colors_enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string blue(const std::string& s)   { return paint(color::BLUE, s); }
inline std::string brown(const std::string& s)  { return paint(color::BROWN, s); }
inline std::string bold(const std::string& s)   { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "+ ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "x ") + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return paint(color::YELLOW, "! ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return paint(color::BROWN, "> ") + msg + "\n";
}

} // namespace theme
