#include "preflight.hpp"
#include <core/config.hpp>
#include <ssh/key_file.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <vector>
#include <fmt/format.h>

namespace fs = std::filesystem;

bool program_available(const std::string& program) {
    std::error_code ec;
    if (program.find('/') != std::string::npos || program.find('\\') != std::string::npos) {
        return fs::exists(program, ec);
    }

    auto path = platform::get_env("PATH");
    if (!path) return false;

#ifdef _WIN32
    const char sep = ';';
    const std::vector<std::string> exts = {"", ".exe"};
#else
    const char sep = ':';
    const std::vector<std::string> exts = {""};
#endif

    size_t start = 0;
    while (start <= path->size()) {
        size_t end = path->find(sep, start);
        std::string dir = path->substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!dir.empty()) {
            for (const auto& ext : exts) {
                if (fs::is_regular_file(fs::path(dir) / (program + ext), ec)) return true;
            }
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return false;
}

std::vector<PreflightIssue> check_config_file(const fs::path& path) {
    std::vector<PreflightIssue> issues;
    std::error_code ec;

    if (!fs::exists(path, ec)) {
        issues.push_back({
            "Config not found at " + path.string(),
            "Run 'sshmirror init', then fill in the connection: block"
        });
        return issues;
    }

    auto result = Config::load(path);
    if (result.is_err()) {
        issues.push_back({result.error, "Check YAML syntax"});
        return issues;
    }

    const auto& cfg = result.value;
    if (!cfg.connection()) {
        issues.push_back({"No connection configured", "Add a connection: block to " + path.string()});
        return issues;
    }

    auto conn_issues = check_connection(*cfg.connection(), cfg.settings());
    issues.insert(issues.end(), conn_issues.begin(), conn_issues.end());

    if (cfg.mappings().empty()) {
        issues.push_back({"No mappings configured", "Add entries under mappings: to sync files", true});
    }
    return issues;
}

std::vector<PreflightIssue> check_connection(const ConnectionDescriptor& conn,
                                             const SshSettings& settings) {
    std::vector<PreflightIssue> issues;

    auto valid = conn.validate();
    if (valid.is_err()) {
        issues.push_back({valid.error, "Set connection.host, connection.username and connection.port"});
    }

    if (!program_available(settings.ssh_program)) {
        issues.push_back({
            fmt::format("'{}' not found", settings.ssh_program),
            "Install the OpenSSH client or set settings.ssh_program"
        });
    }
    if (!program_available(settings.scp_program)) {
        issues.push_back({
            fmt::format("'{}' not found", settings.scp_program),
            "Install the OpenSSH client or set settings.scp_program"
        });
    }

    if (conn.auth_method == AuthMethod::Password) {
        if (conn.password.empty()) {
            issues.push_back({"Password auth selected but no password set", "Set connection.password"});
        } else if (!program_available(settings.sshpass_program)) {
            issues.push_back({
                fmt::format("'{}' not found (needed for password auth)", settings.sshpass_program),
                "Install sshpass or switch connection.auth_method to key"
            });
        }
    } else if (!KeyFileStore::is_private_key_content(conn.private_key_content)) {
        std::error_code ec;
        if (conn.private_key_path.empty()) {
            issues.push_back({
                "No private key configured; ssh will try its default identities",
                "Set connection.private_key_path or private_key_content",
                true
            });
        } else if (!fs::exists(conn.private_key_path, ec)) {
            issues.push_back({
                "Private key not found at " + conn.private_key_path,
                "Fix connection.private_key_path"
            });
        }
    }

    return issues;
}

std::vector<PreflightIssue> run_preflight_checks() {
    return check_config_file(get_config_path());
}
