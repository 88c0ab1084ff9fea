#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (!cli.service) {
        std::cout << theme::fail("Not connected.");
        return;
    }

    cli.service->disconnect();
    std::cout << theme::ok("Master connection closed.");
    std::cout << theme::dim("    The next command reconnects with the configured descriptor.") << "\n";
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (config_exists()) {
        std::cout << theme::kv("Config", get_config_path().string());
    } else {
        std::cout << theme::fail("Config not found");
    }
    std::cout << theme::kv("Log", sshmirror_log_path());

    if (!cli.config.has_value() || !cli.config->connection()) {
        std::cout << theme::fail("No connection configured");
        std::cout << "\n";
        return;
    }

    const auto& conn = *cli.config->connection();
    std::cout << theme::kv("Target", fmt::format("{}:{}", conn.target(), conn.port));

    if (!cli.service) {
        std::cout << theme::kv("Session", "not started");
        std::cout << "\n";
        return;
    }

    SessionStatus status = cli.service->status();
    std::string shown = to_string(status);
    std::cout << theme::kv("Session", status == SessionStatus::Connected ? theme::green(shown)
                                    : status == SessionStatus::Failed ? theme::red(shown)
                                    : shown);
    std::cout << theme::kv("Control", cli.service->session().control_path());
    if (status == SessionStatus::Failed) {
        std::cout << theme::kv("Reason", cli.service->failure_reason());
    }
    if (cli.service->session().sync_in_progress()) {
        std::cout << theme::kv("Sync", "in progress");
    }
    std::cout << "\n";
}

static void do_test(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    if (!cli.service) cli.service = std::make_unique<MirrorService>(cli.config->settings());
    auto result = cli.service->test_connection(*cli.config->connection());
    if (!result.connected) {
        std::cout << theme::fail(result.error.value_or("Connection failed"));
        return;
    }
    std::cout << theme::ok("Authenticated");
    if (result.server_info) {
        std::cout << theme::kv("Server", *result.server_info);
    }
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("disconnect", "Connection", do_disconnect, "Close the master connection");
    cli.add_command("status", "Connection", do_status, "Show config and session status");
    cli.add_command("test", "Connection", do_test, "Log in to the host with a fresh authenticated ssh");
}
