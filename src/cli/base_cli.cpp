#include "base_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto loaded = Config::load();
    if (loaded.is_ok()) {
        config = loaded.value;
    }
}

void BaseCLI::add_command(const std::string& name,
                          const std::string& category,
                          CommandHandler handler,
                          const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {category, std::move(handler), help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Not configured. Run 'sshmirror init' first.");
        return false;
    }
    if (!config->connection()) {
        std::cout << theme::fail("No connection: block in " + get_config_path().string());
        return false;
    }
    return true;
}

bool BaseCLI::require_service() {
    if (!require_config()) return false;
    if (!service) {
        std::cout << theme::fail("Not connected.");
        return false;
    }
    return true;
}

Result<void> BaseCLI::open_session() {
    if (!service) {
        service = std::make_unique<MirrorService>(config->settings());
    }
    return service->connect(*config->connection());
}

// ── Dispatch ───────────────────────────────────────────────

void BaseCLI::dispatch_line(const std::string& line) {
    std::string s = trimmed(line);
    if (s.empty()) return;

    auto space = s.find_first_of(" \t");
    if (space == std::string::npos) {
        execute_command(s);
        return;
    }
    execute_command(s.substr(0, space), trimmed(s.substr(space + 1)));
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::string> categories;
    for (const auto& name : order_) {
        const auto& cat = commands_.at(name).category;
        if (std::find(categories.begin(), categories.end(), cat) == categories.end()) {
            categories.push_back(cat);
        }
    }

    for (const auto& cat : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat << theme::color::RESET << "\n";

        for (const auto& name : order_) {
            const Command& cmd = commands_.at(name);
            if (cmd.category != cat) continue;
            std::cout << theme::color::BLUE << fmt::format("    {:<14}", name) << theme::color::RESET
                      << theme::dim(cmd.help) << "\n";
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // \001 and \002 bracket escape codes so readline measures only visible width
    auto rl_esc = [](const std::string& code) {
        return "\001" + code + "\002";
    };

    std::string base = rl_esc(theme::color::BROWN) + "sshmirror" + rl_esc(theme::color::RESET);
    if (!config.has_value() || !config->connection()) {
        return base + "> ";
    }

    const auto& conn = *config->connection();
    bool connected = service && service->status() == SessionStatus::Connected;
    return base + ":"
         + rl_esc(connected ? theme::color::GREEN : theme::color::RED) + conn.target()
         + rl_esc(theme::color::RESET) + "> ";
}
