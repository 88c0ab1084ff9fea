#include "mirror_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <iostream>
#include <core/utils.hpp>
#include <cstdlib>
#include <core/config.hpp>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>

MirrorCLI::MirrorCLI() : BaseCLI() {
    register_all_commands();
}

void MirrorCLI::register_all_commands() {
    register_connection_commands(*this);
    register_sync_commands(*this);
    register_remote_commands(*this);

    add_command("help", "General", [](BaseCLI& cli, const std::string&) {
        cli.print_help();
    }, "Show this help message");

    auto quit = [](BaseCLI& cli, const std::string&) { cli.quit_requested = true; };
    add_command("quit", "General", quit, "Close the master connection and exit");
    add_command("exit", "General", quit, "Close the master connection and exit");
}

// Print issues; hints never block
bool MirrorCLI::preflight() {
    auto issues = run_preflight_checks();
    bool blocked = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            blocked = true;
        }
        std::cout << theme::step(issue.fix);
    }
    if (blocked) return false;

    // Reload config (preflight confirmed it's valid)
    auto config_result = Config::load();
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return false;
    }
    config = config_result.value;
    return true;
}

int MirrorCLI::run_connected_repl() {
    std::cout << theme::banner();

    std::cout << theme::section("Preflight");
    if (!preflight()) {
        std::cout << "\n";
        return 1;
    }
    std::cout << theme::ok("Config loaded from " + get_config_path().string());

    const auto& conn = *config->connection();
    std::cout << theme::section("Connecting");
    std::cout << theme::step(fmt::format("Opening master connection to {}:{}", conn.target(), conn.port));

    auto result = open_session();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::dim("    Run 'sshmirror test' for a one-shot diagnostic.") << "\n\n";
        return 1;
    }
    std::cout << theme::ok("Master connection is up");

    std::cout << theme::section("Connected");
    std::cout << theme::kv("Host", fmt::format("{}:{}", conn.host, conn.port));
    std::cout << theme::kv("User", conn.username);
    std::cout << theme::kv("Auth", to_string(conn.auth_method));
    std::cout << theme::kv("Mappings", std::to_string(config->mappings().size()));
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        // Reconnect before prompting if the master went away
        if (service) {
            auto healed = service->heal();
            if (healed.is_err()) {
                std::cout << theme::fail("Connection lost: " + healed.error);
                std::cout << theme::step("Commands will retry the connection. Type 'quit' to exit.");
            } else if (healed.value) {
                std::cout << theme::warn("Connection was lost and has been re-established.");
            }
        }

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (trimmed(line).empty()) {
            continue;
        }

        add_history(line.c_str());
        dispatch_line(line);
    }

    std::cout << theme::dim("    Disconnecting...") << "\n";
    if (service) service->disconnect();
    return 0;
}

int MirrorCLI::run_init() {
    fs::path path = get_config_path();
    bool existed = config_exists();

    auto result = create_default_config(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    std::cout << theme::banner();
    std::cout << theme::section("Setup");
    if (existed) {
        std::cout << theme::info("Config already exists at " + path.string());
    } else {
        std::cout << theme::ok("Config written to " + path.string());
    }
    std::cout << theme::step("Fill in the connection: block and add mappings:");
    std::cout << theme::step("Then run 'sshmirror test' to check the connection.");
    std::cout << "\n";
    return 0;
}

int MirrorCLI::run_test() {
    std::cout << theme::section("Connection test");
    if (!preflight()) {
        std::cout << "\n";
        return 1;
    }

    const auto& conn = *config->connection();
    std::cout << theme::step(fmt::format("Probing {}:{}", conn.target(), conn.port));

    if (!service) service = std::make_unique<MirrorService>(config->settings());
    auto result = service->test_connection(conn);
    if (!result.connected) {
        std::cout << theme::fail(result.error.value_or("Connection failed"));
        std::cout << "\n";
        return 1;
    }

    std::cout << theme::ok("Authenticated");
    if (result.server_info) {
        std::cout << theme::kv("Server", *result.server_info);
    }
    std::cout << "\n";
    return 0;
}

int MirrorCLI::run_sync(const std::string& module) {
    if (!preflight()) return 1;

    auto result = open_session();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    execute_command("sync", module);
    service->disconnect();
    return last_sync_ok ? 0 : 1;
}
