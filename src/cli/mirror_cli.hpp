#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_sync_commands(BaseCLI& cli);
void register_remote_commands(BaseCLI& cli);

class MirrorCLI : public BaseCLI {
public:
    MirrorCLI();

    // Preflight, connect, then the readline loop until quit or EOF
    int run_connected_repl();

    // One-shot subcommands; return the process exit code
    int run_init();
    int run_test();
    int run_sync(const std::string& module);

private:
    void register_all_commands();
    bool preflight();
};
