#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <optional>
#include <fmt/format.h>
#include <core/utils.hpp>

static void do_sync(BaseCLI& cli, const std::string& arg) {
    cli.last_sync_ok = false;
    if (!cli.require_service()) return;

    std::optional<std::string> module;
    std::string m = trimmed(arg);
    if (!m.empty()) module = m;

    const auto& mappings = cli.config->mappings();
    if (mappings.empty()) {
        std::cout << theme::info("No mappings configured.");
        cli.last_sync_ok = true;
        return;
    }

    std::cout << theme::section(module ? "Sync: " + *module : "Sync");

    auto result = cli.service->sync(mappings, module);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }

    const SyncResult& r = result.value;
    for (const auto& entry : r.synced_files) {
        std::cout << theme::transfer(entry);
    }
    for (const auto& name : r.skipped_files) {
        std::cout << theme::info(name + theme::dim(" (nothing to send)"));
    }
    for (const auto& err : r.errors) {
        std::cout << theme::fail(err);
    }

    std::cout << "\n" << theme::dim(fmt::format("    {} synced, {} skipped, {} failed",
                                                 r.synced_files.size(), r.skipped_files.size(),
                                                 r.errors.size())) << "\n";
    cli.last_sync_ok = r.success;
}

static void do_mappings(BaseCLI& cli, const std::string& arg) {
    if (!cli.config.has_value()) {
        std::cout << theme::fail("Not configured. Run 'sshmirror init' first.");
        return;
    }

    std::string module = trimmed(arg);
    std::cout << theme::section(module.empty() ? "Mappings" : "Mappings: " + module);
    const auto mappings = module.empty() ? cli.config->mappings() : cli.config->mappings_for(module);
    if (mappings.empty()) {
        std::cout << theme::dim("    (none)") << "\n\n";
        return;
    }

    for (const auto& m : mappings) {
        std::string kind = m.is_directory ? "dir" : m.is_pattern ? "glob" : "file";
        std::string label = fmt::format("{} [{}{}]", m.name, m.module.empty() ? "-" : m.module,
                                        m.enabled ? "" : ", disabled");
        std::cout << theme::color::BLUE << fmt::format("    {:<5}", kind) << theme::color::RESET
                  << label << "\n";
        std::cout << theme::dim(fmt::format("          {} -> {}", m.local_path, m.remote_path)) << "\n";
    }
    std::cout << "\n";
}

void register_sync_commands(BaseCLI& cli) {
    cli.add_command("sync", "Sync", do_sync, "Push enabled mappings (optionally one module)");
    cli.add_command("mappings", "Sync", do_mappings, "List mappings (optionally one module)");
}
