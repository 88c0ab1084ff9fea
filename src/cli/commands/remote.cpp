#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <utility>
#include <fmt/format.h>
#include <core/utils.hpp>

// "first rest of line" -> {"first", "rest of line"}
static std::pair<std::string, std::string> split_first(const std::string& arg) {
    std::string s = trimmed(arg);
    auto space = s.find_first_of(" \t");
    if (space == std::string::npos) return {s, ""};
    std::string rest = s.substr(space + 1);
    trim(rest);
    return {s.substr(0, space), rest};
}

static void do_read(BaseCLI& cli, const std::string& arg) {
    std::string path = trimmed(arg);
    if (path.empty()) {
        std::cout << theme::fail("Usage: read <remote-path>");
        return;
    }
    if (!cli.require_service()) return;

    auto result = cli.service->read_file(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    if (result.value.empty()) {
        std::cout << theme::dim("    (empty or missing)") << "\n";
        return;
    }
    std::cout << result.value;
    if (result.value.back() != '\n') std::cout << "\n";
}

static void do_write(BaseCLI& cli, const std::string& arg) {
    auto [path, text] = split_first(arg);
    if (path.empty()) {
        std::cout << theme::fail("Usage: write <remote-path> <text>");
        return;
    }
    if (!cli.require_service()) return;

    auto result = cli.service->write_file(path, text + "\n");
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok(fmt::format("Wrote {} bytes to {}", text.size() + 1, path));
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    std::string path = trimmed(arg);
    if (path.empty()) path = "~";
    if (!cli.require_service()) return;

    auto result = cli.service->list_dir(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    if (result.value.empty()) {
        std::cout << theme::dim("    (empty or missing)") << "\n";
        return;
    }
    for (const auto& name : result.value) {
        std::cout << "    " << name << "\n";
    }
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    std::string path = trimmed(arg);
    auto result = cli.service->remove_path(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Removed " + path);
}

static void do_link(BaseCLI& cli, const std::string& arg) {
    auto [target, link] = split_first(arg);
    if (target.empty() || link.empty()) {
        std::cout << theme::fail("Usage: link <target> <link-path>");
        return;
    }
    if (!cli.require_service()) return;

    auto result = cli.service->create_symlink(target, link);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok(link + theme::dim(" -> ") + target);
}

static void do_checklink(BaseCLI& cli, const std::string& arg) {
    auto [link, target] = split_first(arg);
    if (link.empty() || target.empty()) {
        std::cout << theme::fail("Usage: checklink <link-path> <expected-target>");
        return;
    }
    if (!cli.require_service()) return;

    if (cli.service->check_symlink(link, target)) {
        std::cout << theme::ok(link + theme::dim(" -> ") + target);
    } else {
        std::cout << theme::fail(link + " is not a symlink to " + target);
    }
}

void register_remote_commands(BaseCLI& cli) {
    cli.add_command("read", "Remote", do_read, "Print a remote file");
    cli.add_command("write", "Remote", do_write, "Write a line of text to a remote file");
    cli.add_command("ls", "Remote", do_ls, "List a remote directory");
    cli.add_command("rm", "Remote", do_rm, "Delete a remote path recursively");
    cli.add_command("link", "Remote", do_link, "Create a remote symlink: link <target> <link>");
    cli.add_command("checklink", "Remote", do_checklink, "Check a remote symlink: checklink <link> <target>");
}
