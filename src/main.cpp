#include <iostream>
#include <string>
#include "cli/mirror_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sshmirror"
              << theme::color::RESET << theme::color::DIM
              << "                  Connect and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshmirror connect"
              << theme::color::RESET << theme::color::DIM
              << "          Connect and enter REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshmirror init"
              << theme::color::RESET << theme::color::DIM
              << "             Write a config template" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshmirror test"
              << theme::color::RESET << theme::color::DIM
              << "             Check that the host accepts our credentials" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshmirror sync "
              << theme::color::RESET << theme::color::BROWN << "[module]"
              << theme::color::RESET << theme::color::DIM
              << "    Push mappings and exit" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sshmirror --version        Show version\n"
              << "    sshmirror --help           Show this help\n\n"
              << "    Config: ~/.sshmirror/config.yaml (override with SSHMIRROR_CONFIG)"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "sshmirror"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << VERSION_STRING << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help" || cmd == "-h") {
                print_usage();
                return 0;
            }
        }

        MirrorCLI cli;

        if (argc == 1) {
            return cli.run_connected_repl();
        }

        std::string cmd = argv[1];
        if (cmd == "connect") {
            return cli.run_connected_repl();
        } else if (cmd == "init") {
            return cli.run_init();
        } else if (cmd == "test") {
            return cli.run_test();
        } else if (cmd == "sync") {
            return cli.run_sync(argc >= 3 ? argv[2] : "");
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
