#include "cli.hpp"

#include "termctl/mcp.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        termctl::startup_config cfg{};
        if (auto cli_result = termctl::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return termctl::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
