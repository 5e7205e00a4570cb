#include "scour/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        scour::session_config cfg{};
        if (auto cli_result = scour::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return scour::cli::run(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
