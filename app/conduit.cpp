#include "conduit/cli.hpp"

#include <exception>
#include <iostream>
#include <utility>

int main(int argc, char** argv) {
    try {
        conduit::runtime_config cfg{};
        conduit::cli::command_options cmd{};
        if (auto cli_result = conduit::cli::parse_cli(argc, argv, cfg, cmd)) {
            return *cli_result;
        }

        return conduit::cli::execute(std::move(cfg), cmd);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
