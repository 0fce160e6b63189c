#include "../aisafe_cli.hpp"
#include "../debug_log.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_set(AisafeCLI& cli, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) return cli.usage_error("set");

    const std::string& key = args[0];
    // Check the key before prompting for a secret that would be thrown away
    if (!split_dotted_key(key)) {
        return cli.report(ErrorKind::InvalidKey,
                          fmt::format("Invalid key '{}': expected <section>.<key>", key));
    }

    std::string value;
    if (args.size() == 2) {
        value = args[1];
    } else {
        value = cli.read_secret(fmt::format("Enter value for '{}': ", key));
        if (value.empty()) {
            return cli.report(ErrorKind::None, "Value cannot be empty.");
        }
    }

    auto r = cli.store().set(key, Value{value});
    if (r.is_err()) return cli.report(r);

    aisafe_log(fmt::format("set key={}", key));
    std::cout << theme::ok(fmt::format("Set '{}'", key));
    return 0;
}

static int do_get(AisafeCLI& cli, const std::vector<std::string>& args) {
    if (args.size() != 1) return cli.usage_error("get");

    auto r = cli.store().get(args[0]);
    if (r.is_err()) return cli.report(r);

    // Bare value on stdout so it can be captured by scripts
    std::cout << format_value(r.value) << "\n";
    return 0;
}

static int do_list(AisafeCLI& cli, const std::vector<std::string>& args) {
    if (args.size() > 1) return cli.usage_error("list");

    if (args.size() == 1) {
        const std::string& section = args[0];
        auto keys = cli.store().list_keys(section);
        if (keys.is_err()) return cli.report(keys);
        if (keys.value.empty()) {
            return cli.report(ErrorKind::KeyNotFound,
                              fmt::format("Section '{}' not found or empty", section));
        }
        for (const auto& key : keys.value) {
            std::cout << "  " << section << "." << key << "\n";
        }
        return 0;
    }

    auto all = cli.store().list_all();
    if (all.is_err()) return cli.report(all);

    if (all.value.empty()) {
        std::cout << "No credentials configured yet.\n";
        std::cout << theme::step(fmt::format("Run '{} set <section>.<key>' to add one.", APP_NAME));
        return 0;
    }
    for (const auto& section : all.value) {
        std::cout << theme::brown("[" + section.name + "]") << "\n";
        for (const auto& key : section.keys) {
            std::cout << "  " << key << "\n";
        }
    }
    return 0;
}

static int do_remove(AisafeCLI& cli, const std::vector<std::string>& args) {
    if (args.size() != 1) return cli.usage_error("remove");

    auto r = cli.store().remove(args[0]);
    if (r.is_err()) return cli.report(r);

    aisafe_log(fmt::format("remove key={}", args[0]));
    std::cout << theme::ok(fmt::format("Removed '{}'", args[0]));
    return 0;
}

static int do_path(AisafeCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty()) return cli.usage_error("path");

    std::cout << cli.store().path().string();
    if (!cli.store().exists()) {
        std::cout << " " << theme::dim("(not created yet)");
    }
    std::cout << "\n";
    return 0;
}

void register_credential_commands(AisafeCLI& cli) {
    cli.add_command("set", do_set, "set <key> [value]",
                    "Set a credential (prompts for the value if omitted)");
    cli.add_command("get", do_get, "get <key>", "Print a credential value");
    cli.add_command("list", do_list, "list [section]", "List sections, or the keys of one section");
    cli.add_command("remove", do_remove, "remove <key>", "Remove a credential");
    cli.add_command("path", do_path, "path", "Show the credentials file path");
}
