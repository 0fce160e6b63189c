#include "aisafe_cli.hpp"
#include "debug_log.hpp"
#include "prompt.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>
#include <optional>
#include <fmt/format.h>

static Config load_config_or_defaults() {
    auto config_result = Config::load();
    if (config_result.is_err()) {
        std::cerr << theme::warn(config_result.error + " (using defaults)");
        return Config();
    }
    return config_result.value;
}

AisafeCLI::AisafeCLI() : AisafeCLI(load_config_or_defaults()) {}

AisafeCLI::AisafeCLI(const Config& config)
    : config_(config), secret_reader_(read_hidden) {
    theme::colors_enabled() = config_.color();
    aisafe_log_enabled() = config_.debug_log();

    register_credential_commands(*this);
}

void AisafeCLI::add_command(const std::string& name,
                            CommandHandler handler,
                            const std::string& usage,
                            const std::string& help) {
    if (commands_.find(name) == commands_.end()) {
        command_order_.push_back(name);
    }
    commands_[name] = {std::move(handler), usage, help};
}

int AisafeCLI::run(int argc, char** argv) {
    std::optional<fs::path> file_override;
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        // Global options are only recognised before the command name
        if (words.empty()) {
            if (arg == "--help" || arg == "-h") {
                print_help();
                return 0;
            }
            if (arg == "--version") {
                print_version();
                return 0;
            }
            if (arg == "--file") {
                if (i + 1 >= argc) {
                    std::cerr << theme::fail("--file needs a path");
                    return 1;
                }
                file_override = fs::path(argv[++i]);
                continue;
            }
            if (arg.rfind("--file=", 0) == 0) {
                file_override = fs::path(arg.substr(7));
                continue;
            }
            if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << theme::fail("Unknown option: " + arg);
                return 1;
            }
        }
        words.push_back(arg);
    }

    if (words.empty()) {
        print_help();
        return 1;
    }

    store_ = file_override ? std::make_unique<CredentialStore>(*file_override)
                           : std::make_unique<CredentialStore>();
    store_->set_fresh_reads(config_.fresh_reads());

    std::string command = words.front();
    words.erase(words.begin());
    return execute_command(command, words);
}

int AisafeCLI::execute_command(const std::string& name, const std::vector<std::string>& args) {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + name);
        std::cerr << theme::step(fmt::format("Run '{} --help' for available commands.", APP_NAME));
        return 1;
    }

    aisafe_log(fmt::format("command={} args={}", name, args.size()));
    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        aisafe_log(fmt::format("command={} exception={}", name, e.what()));
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}

int AisafeCLI::report(ErrorKind kind, const std::string& message) {
    aisafe_log(fmt::format("error kind={}", error_kind_name(kind)));
    std::cerr << theme::fail(message);
    return 1;
}

int AisafeCLI::usage_error(const std::string& command) {
    auto it = commands_.find(command);
    std::string usage = it != commands_.end() ? it->second.usage : command;
    std::cerr << theme::fail(fmt::format("Usage: {} {}", APP_NAME, usage));
    return 1;
}

void AisafeCLI::print_help() const {
    std::cout << theme::bold(APP_NAME) << theme::dim(fmt::format(" {}", APP_VERSION))
              << "  local credential store\n\n";

    std::cout << theme::brown(theme::bold("Usage")) << "\n";
    std::cout << fmt::format("    {} [--file <path>] <command> [args]\n\n", APP_NAME);

    std::cout << theme::brown(theme::bold("Commands")) << "\n";
    for (const auto& name : command_order_) {
        const auto& cmd = commands_.at(name);
        std::cout << "    " << theme::blue(fmt::format("{:<22}", cmd.usage))
                  << theme::dim(cmd.help) << "\n";
    }

    std::cout << "\n" << theme::brown(theme::bold("Options")) << "\n";
    std::cout << "    " << theme::blue(fmt::format("{:<22}", "--file <path>"))
              << theme::dim(fmt::format("Credentials file (default: ${} or the config dir)",
                                        ENV_CREDENTIALS_FILE)) << "\n";
    std::cout << "    " << theme::blue(fmt::format("{:<22}", "--version"))
              << theme::dim("Show version") << "\n";
    std::cout << "    " << theme::blue(fmt::format("{:<22}", "--help"))
              << theme::dim("Show this help") << "\n";
}

void AisafeCLI::print_version() const {
    std::cout << APP_NAME << " version " << APP_VERSION << "\n";
}
