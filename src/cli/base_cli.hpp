#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/mirror_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    // Help lists categories in the order they are first registered
    void add_command(const std::string& name,
                     const std::string& category,
                     CommandHandler handler,
                     const std::string& help);

    bool require_config();

    // Config present and a service built. The service reconnects on its own.
    bool require_service();

    // Build the service from config (once) and connect it
    Result<void> open_session();

    // Split "command rest of line" and run it
    void dispatch_line(const std::string& line);
    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<MirrorService> service;
    bool quit_requested = false;
    bool last_sync_ok = true;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    struct Command {
        std::string category;
        CommandHandler handler;
        std::string help;
    };

    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;
};
