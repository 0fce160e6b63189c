#include <iostream>
#include <string>
#include "cli/aisafe_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        AisafeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
