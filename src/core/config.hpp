#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Optional CLI settings, <config dir>/config.yaml:
//
//   color: true          # ANSI colors in CLI output
//   fresh_reads: false   # store re-reads the file on every read
//   debug_log: false     # append to <config dir>/aisafe_debug.log
//
// Unknown keys are ignored.
class Config {
public:
    // Missing file means defaults. ParseError for malformed YAML or a
    // value of the wrong type, IOError if the file cannot be read.
    static Result<Config> load(const fs::path& path);

    // load(get_config_path())
    static Result<Config> load();

    bool color() const { return color_; }
    bool fresh_reads() const { return fresh_reads_; }
    bool debug_log() const { return debug_log_; }

public:
    Config() = default;

private:
    bool color_ = true;
    bool fresh_reads_ = false;
    bool debug_log_ = false;
};
