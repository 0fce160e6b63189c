#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <utility>
#include <core/config.hpp>
#include <core/credential_store.hpp>

class AisafeCLI;

// Forward declarations for command registration
void register_credential_commands(AisafeCLI& cli);

// Command-line front end: global options, command dispatch, and the
// mapping from store errors to one-line messages and exit codes.
class AisafeCLI {
public:
    // Loads config.yaml, warning and falling back to defaults if it is bad
    AisafeCLI();
    explicit AisafeCLI(const Config& config);

    // Returns the process exit code
    using CommandHandler = std::function<int(AisafeCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // Parses argv, builds the store and runs one command. Returns the exit code.
    int run(int argc, char** argv);

    void print_help() const;
    void print_version() const;

    // Print a one-line failure to stderr and return the failure exit code.
    int report(ErrorKind kind, const std::string& message);
    int usage_error(const std::string& command);

    template <typename T>
    int report(const Result<T>& r) { return report(r.kind, r.error); }

    // Reads a value for `set` when none is given on the command line.
    // read_hidden unless replaced.
    using SecretReader = std::function<std::string(const std::string& prompt)>;
    void set_secret_reader(SecretReader reader) { secret_reader_ = std::move(reader); }
    std::string read_secret(const std::string& prompt) { return secret_reader_(prompt); }

    CredentialStore& store() { return *store_; }
    const Config& config() const { return config_; }

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };

    int execute_command(const std::string& name, const std::vector<std::string>& args);

    Config config_;
    SecretReader secret_reader_;
    std::unique_ptr<CredentialStore> store_;
    std::map<std::string, Command> commands_;
    std::vector<std::string> command_order_;
};
